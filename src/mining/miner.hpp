/**
 * @file miner.hpp
 * @brief Перебор nonce для заголовка блока
 *
 * Машина состояний:
 * @code
 * Searching --(hash <= target)--> Found
 * Searching --(бюджет исчерпан, сдвиг времени запрещён)--> Exhausted
 * Searching --(бюджет исчерпан, сдвиг разрешён)--> Searching (timestamp + 1)
 * @endcode
 *
 * Каждая попытка:
 * 1. Кодирование заголовка с текущими (timestamp, nonce)
 * 2. Одинарный SHA256 (первые 64 байта заголовка берутся из midstate)
 * 3. Сравнение с target как big-endian чисел
 *
 * Nonce в заголовке занимает 8 байт, старшие 4 байта всегда нулевые;
 * младшие 32 бита переходят через 2^32 в 0. При сдвиге времени nonce не
 * сбрасывается, чтобы не повторять уже проверенные заголовки.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"
#include "../core/primitives/block_header.hpp"
#include "../core/primitives/uint256.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string_view>

namespace proofsmith::mining {

// =============================================================================
// Состояние майнера
// =============================================================================

/**
 * @brief Состояние перебора
 */
enum class MinerState {
    Searching,  ///< Перебор идёт (или ещё не начат)
    Found,      ///< Найден подходящий заголовок
    Exhausted   ///< Бюджет попыток исчерпан
};

/**
 * @brief Преобразовать состояние в строку
 */
[[nodiscard]] constexpr std::string_view to_string(MinerState state) noexcept {
    switch (state) {
        case MinerState::Searching: return "searching";
        case MinerState::Found:     return "found";
        case MinerState::Exhausted: return "exhausted";
    }
    return "unknown";
}

// =============================================================================
// Параметры и результат
// =============================================================================

/**
 * @brief Шаблон заголовка: всё, кроме перебираемых полей, фиксировано
 */
struct HeaderTemplate {
    int32_t version{constants::DEFAULT_BLOCK_VERSION};
    Hash256 prev_hash{};
    Hash256 merkle_root{};
    uint32_t timestamp{0};
    uint32_t start_nonce{0};

    /**
     * @brief Заголовок с начальными timestamp и nonce
     */
    [[nodiscard]] core::BlockHeader to_header() const noexcept;
};

/**
 * @brief Параметры перебора
 */
struct MiningParams {
    /// @brief Попыток на один timestamp (должно быть > 0)
    uint64_t max_attempts{constants::DEFAULT_MAX_ATTEMPTS};

    /// @brief Увеличивать timestamp при исчерпании бюджета
    bool allow_time_increment{false};
};

/**
 * @brief Результат успешного перебора
 */
struct MiningResult {
    /// @brief Найденный заголовок
    core::BlockHeader header;

    /// @brief Заголовок в сериализованном виде
    core::HeaderBytes encoded{};

    /// @brief SHA256 заголовка
    Hash256 hash{};

    /// @brief Выигравший timestamp
    uint32_t timestamp{0};

    /// @brief Выигравший nonce
    uint32_t nonce{0};

    /// @brief Неудачных попыток на выигравшем timestamp
    uint64_t attempts{0};

    /// @brief Всего вычислено хешей (включая выигравший)
    uint64_t hashes_total{0};

    /// @brief Сколько раз сдвигался timestamp
    uint32_t time_increments{0};

    /// @brief Время перебора
    std::chrono::duration<double> elapsed{0};

    /**
     * @brief Скорость перебора (хешей в секунду)
     */
    [[nodiscard]] double hashrate() const noexcept {
        const double seconds = elapsed.count();
        return seconds > 0.0 ? static_cast<double>(hashes_total) / seconds : 0.0;
    }
};

// =============================================================================
// Miner
// =============================================================================

/**
 * @brief Однопоточный перебор nonce
 *
 * Владеет заголовком на время перебора. Ввода/вывода в цикле нет.
 */
class Miner {
public:
    /**
     * @brief Создать майнер
     *
     * @param tmpl Шаблон заголовка
     * @param target Декодированный target
     * @param params Бюджет попыток и флаг сдвига времени
     */
    Miner(const HeaderTemplate& tmpl, const core::uint256& target, MiningParams params) noexcept;

    /**
     * @brief Запустить перебор с начала шаблона
     *
     * @param cancel Флаг отмены (проверяется перед каждой попыткой), может быть nullptr
     * @return Result<MiningResult> Результат или ошибка:
     *         ConfigInvalidValue (max_attempts == 0),
     *         SearchExhausted (бюджет исчерпан или переполнение timestamp),
     *         SearchCancelled (флаг отмены выставлен)
     */
    [[nodiscard]] Result<MiningResult> run(const std::atomic<bool>* cancel = nullptr);

    /**
     * @brief Текущее состояние
     */
    [[nodiscard]] MinerState state() const noexcept { return state_; }

    /**
     * @brief Хешей вычислено в последнем запуске
     */
    [[nodiscard]] uint64_t hashes_total() const noexcept { return hashes_total_; }

    /**
     * @brief Target перебора
     */
    [[nodiscard]] const core::uint256& target() const noexcept { return target_; }

private:
    HeaderTemplate template_;
    core::uint256 target_;
    MiningParams params_;

    MinerState state_{MinerState::Searching};
    uint64_t hashes_total_{0};
};

} // namespace proofsmith::mining
