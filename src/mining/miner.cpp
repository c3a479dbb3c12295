/**
 * @file miner.cpp
 * @brief Реализация перебора nonce
 */

#include "miner.hpp"
#include "../core/byte_order.hpp"
#include "../crypto/sha256.hpp"
#include "../pow/target.hpp"

#include <format>
#include <limits>
#include <span>

namespace proofsmith::mining {

using namespace constants;

namespace {

/// @brief Смещение хвоста заголовка (второй SHA256 блок)
constexpr std::size_t TAIL_OFFSET = SHA256_BLOCK_SIZE;

/// @brief Длина хвоста заголовка
constexpr std::size_t TAIL_SIZE = BLOCK_HEADER_SIZE - SHA256_BLOCK_SIZE;

static_assert(HEADER_TIME_OFFSET >= TAIL_OFFSET,
              "timestamp должен лежать во втором блоке SHA256");

} // anonymous namespace

core::BlockHeader HeaderTemplate::to_header() const noexcept {
    core::BlockHeader header;
    header.version = version;
    header.prev_hash = prev_hash;
    header.merkle_root = merkle_root;
    header.timestamp = timestamp;
    header.nonce = start_nonce;
    return header;
}

Miner::Miner(const HeaderTemplate& tmpl, const core::uint256& target, MiningParams params) noexcept
    : template_(tmpl)
    , target_(target)
    , params_(params) {}

Result<MiningResult> Miner::run(const std::atomic<bool>* cancel) {
    state_ = MinerState::Searching;
    hashes_total_ = 0;

    if (params_.max_attempts == 0) {
        return Err<MiningResult>(
            ErrorCode::ConfigInvalidValue,
            "max_attempts должен быть больше 0"
        );
    }

    const auto started = std::chrono::steady_clock::now();

    // Первые 64 байта (version, prev_hash, 28 байт merkle_root) не меняются
    core::HeaderBytes encoded = template_.to_header().serialize();
    const crypto::Sha256State midstate = crypto::compute_midstate(encoded.data());
    const std::span<const uint8_t, TAIL_SIZE> tail(encoded.data() + TAIL_OFFSET, TAIL_SIZE);

    uint32_t timestamp = template_.timestamp;
    uint32_t nonce = template_.start_nonce;
    uint64_t attempts = 0;
    uint32_t time_increments = 0;

    while (true) {
        if (cancel != nullptr && cancel->load(std::memory_order_relaxed)) {
            return Err<MiningResult>(
                ErrorCode::SearchCancelled,
                std::format("Перебор отменён после {} хешей", hashes_total_)
            );
        }

        write_be32(encoded.data() + HEADER_TIME_OFFSET, timestamp);
        write_be64(encoded.data() + HEADER_NONCE_OFFSET, nonce);

        const Hash256 hash = crypto::hash_header_with_midstate(midstate, tail);
        ++hashes_total_;

        if (pow::meets_target(hash, target_)) {
            state_ = MinerState::Found;

            MiningResult result;
            result.header = core::BlockHeader::deserialize(encoded);
            result.encoded = encoded;
            result.hash = hash;
            result.timestamp = timestamp;
            result.nonce = nonce;
            result.attempts = attempts;
            result.hashes_total = hashes_total_;
            result.time_increments = time_increments;
            result.elapsed = std::chrono::steady_clock::now() - started;
            return result;
        }

        ++nonce;  // переход 2^32 -> 0
        ++attempts;

        if (attempts >= params_.max_attempts) {
            if (!params_.allow_time_increment) {
                state_ = MinerState::Exhausted;
                return Err<MiningResult>(
                    ErrorCode::SearchExhausted,
                    std::format("Достигнут лимит попыток ({}) для timestamp {}; "
                                "увеличьте max_attempts или разрешите сдвиг времени",
                                params_.max_attempts, timestamp)
                );
            }
            if (timestamp == std::numeric_limits<uint32_t>::max()) {
                state_ = MinerState::Exhausted;
                return Err<MiningResult>(
                    ErrorCode::SearchExhausted,
                    "Timestamp достиг максимума 2^32 - 1"
                );
            }
            ++timestamp;
            ++time_increments;
            attempts = 0;
        }
    }
}

} // namespace proofsmith::mining
