/**
 * @file main.cpp
 * @brief Точка входа proofsmith
 *
 * proofsmith - инструменты для Merkle дерева транзакций и заголовка блока:
 * 1. root             - корень Merkle дерева по списку txid
 * 2. prove            - доказательство включения требуемого txid
 * 3. verify           - проверка доказательства по списку txid
 * 4. verify-committed - проверка доказательства по опубликованным дайджестам
 * 5. commit           - публикация дайджестов правильного ответа
 * 6. mine             - перебор nonce для заголовка блока
 * 7. check-header     - проверка присланного заголовка
 * 8. check-selection  - проверка набора транзакций кандидата в блок
 *
 * Использование:
 *   proofsmith [ОПЦИИ] <команда> [ОПЦИИ КОМАНДЫ]
 *
 * Коды завершения:
 *   0 - успех, 1 - ответ отклонён, 2 - ошибка входных данных,
 *   3 - внутреннее противоречие, 4 - перебор исчерпан или отменён
 */

#include "core/types.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/hex.hpp"
#include "core/verdict.hpp"
#include "core/primitives/block_header.hpp"
#include "io/files.hpp"
#include "log/logger.hpp"
#include "mempool/selection_checker.hpp"
#include "merkle/merkle_tree.hpp"
#include "merkle/proof.hpp"
#include "merkle/verifier.hpp"
#include "mining/miner.hpp"
#include "pow/header_checker.hpp"
#include "pow/target.hpp"

#include <atomic>
#include <charconv>
#include <csignal>
#include <filesystem>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace {

using namespace proofsmith;

/// @brief Версия программы
constexpr std::string_view VERSION = "1.0.0";

/// @brief Флаг отмены перебора nonce
std::atomic<bool> g_cancel{false};

/**
 * @brief Обработчик сигналов
 */
void signal_handler(int signum) {
    if (signum == SIGINT || signum == SIGTERM) {
        g_cancel.store(true, std::memory_order_relaxed);
    }
}

/**
 * @brief Вывести справку
 */
void print_help() {
    std::cout << R"(
proofsmith v)" << VERSION << R"(
Merkle дерево, доказательства включения и перебор nonce заголовка блока

ИСПОЛЬЗОВАНИЕ:
    proofsmith [ОПЦИИ] <КОМАНДА> [ОПЦИИ КОМАНДЫ]

КОМАНДЫ:
    root                 Вычислить Merkle root списка txid
    prove                Построить доказательство включения и записать его
    verify               Проверить доказательство по списку txid
    verify-committed     Проверить доказательство по опубликованным дайджестам
    commit               Записать дайджесты корня и sibling'ов
    mine                 Найти nonce для заголовка и записать заголовок
    check-header         Проверить заголовок блока
    check-selection      Проверить набор транзакций кандидата в блок

ОПЦИИ:
    -c, --config PATH    Путь к файлу конфигурации (proofsmith.toml)
    -q, --quiet          Только ошибки
    -v, --verbose        Подробный вывод
    --no-color           Отключить ANSI цвета
    -h, --help           Показать эту справку
    --version            Показать версию программы

ОПЦИИ КОМАНДЫ:
    --leaves PATH        Список txid
    --proof PATH         Файл доказательства
    --reference PATH     Файл опубликованных дайджестов
    --header PATH        Файл заголовка
    --mempool PATH       CSV мемпула
    --selection PATH     Кандидат в блок
    --coinbase PATH      Файл txid coinbase (mine, check-header)
    --no-coinbase        Не добавлять coinbase к листьям заголовка
    --txid HEX           Требуемый txid (вместо REQUIRED_TXID и файлов)
    --index N            Индекс листа (для prove)
    --out PATH           Файл результата
    --target HEX8        Compact target
    --prev HEX           Хеш предыдущего блока
    --block-version N    Версия блока
    --time N             Начальный timestamp
    --nonce N            Начальный nonce
    --max-attempts N     Попыток на один timestamp
    --allow-time-increment  Увеличивать timestamp при исчерпании попыток

ПРИМЕРЫ:
    proofsmith root --leaves solutions/exercise01.txt
    REQUIRED_TXID=4c50... proofsmith prove
    proofsmith -c proofsmith.toml mine --allow-time-increment

)";
}

/**
 * @brief Вывести версию
 */
void print_version() {
    std::cout << "proofsmith v" << VERSION << std::endl;
}

/**
 * @brief Парсинг аргументов командной строки
 */
struct Args {
    std::optional<std::string> config_path;
    bool show_help = false;
    bool show_version = false;
    bool quiet = false;
    bool verbose = false;
    bool no_color = false;

    std::string command;

    std::optional<std::string> leaves;
    std::optional<std::string> proof;
    std::optional<std::string> reference;
    std::optional<std::string> header;
    std::optional<std::string> mempool;
    std::optional<std::string> selection;
    std::optional<std::string> coinbase;
    bool no_coinbase = false;
    std::optional<std::string> txid;
    std::optional<std::size_t> index;
    std::optional<std::string> out;
    std::optional<std::string> target;
    std::optional<std::string> prev;
    std::optional<int32_t> block_version;
    std::optional<uint32_t> time;
    std::optional<uint32_t> nonce;
    std::optional<uint64_t> max_attempts;
    bool allow_time_increment = false;
};

template<typename T>
[[nodiscard]] Result<T> parse_number(std::string_view option, std::string_view text) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return Err<T>(
            ErrorCode::ConfigInvalidValue,
            std::format("{}: ожидается целое число, получено '{}'", option, text)
        );
    }
    return value;
}

Result<Args> parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        // Опции со значением
        auto value = [&]() -> Result<std::string_view> {
            if (i + 1 >= argc) {
                return Err<std::string_view>(
                    ErrorCode::ConfigInvalidValue,
                    std::format("{}: не указано значение", arg)
                );
            }
            return std::string_view{argv[++i]};
        };

        auto set_string = [&](std::optional<std::string>& out) -> Result<void> {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            out = std::string(*v);
            return {};
        };

        auto set_number = [&]<typename T>(std::optional<T>& out) -> Result<void> {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            auto n = parse_number<T>(arg, *v);
            if (!n) return std::unexpected(n.error());
            out = *n;
            return {};
        };

        Result<void> status;

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "--version") {
            args.show_version = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--no-color") {
            args.no_color = true;
        } else if (arg == "-c" || arg == "--config") {
            status = set_string(args.config_path);
        } else if (arg == "--leaves") {
            status = set_string(args.leaves);
        } else if (arg == "--proof") {
            status = set_string(args.proof);
        } else if (arg == "--reference") {
            status = set_string(args.reference);
        } else if (arg == "--header") {
            status = set_string(args.header);
        } else if (arg == "--mempool") {
            status = set_string(args.mempool);
        } else if (arg == "--selection") {
            status = set_string(args.selection);
        } else if (arg == "--coinbase") {
            status = set_string(args.coinbase);
        } else if (arg == "--no-coinbase") {
            args.no_coinbase = true;
        } else if (arg == "--txid") {
            status = set_string(args.txid);
        } else if (arg == "--index") {
            status = set_number(args.index);
        } else if (arg == "--out") {
            status = set_string(args.out);
        } else if (arg == "--target") {
            status = set_string(args.target);
        } else if (arg == "--prev") {
            status = set_string(args.prev);
        } else if (arg == "--block-version") {
            status = set_number(args.block_version);
        } else if (arg == "--time") {
            status = set_number(args.time);
        } else if (arg == "--nonce") {
            status = set_number(args.nonce);
        } else if (arg == "--max-attempts") {
            status = set_number(args.max_attempts);
        } else if (arg == "--allow-time-increment") {
            args.allow_time_increment = true;
        } else if (!arg.starts_with("-") && args.command.empty()) {
            args.command = std::string(arg);
        } else {
            return Err<Args>(
                ErrorCode::ConfigInvalidValue,
                std::format("Неизвестный аргумент: {}", arg)
            );
        }

        if (!status) {
            return std::unexpected(status.error());
        }
    }

    return args;
}

// =============================================================================
// Общие шаги команд
// =============================================================================

/**
 * @brief Контекст выполнения команды
 */
struct Context {
    const Args& args;
    Config& config;
    log::Logger& logger;
};

/**
 * @brief Путь из аргумента или из конфигурации
 */
[[nodiscard]] std::filesystem::path pick(
    const std::optional<std::string>& arg,
    const std::filesystem::path& configured
) {
    return arg ? std::filesystem::path(*arg) : configured;
}

/**
 * @brief Список txid для дерева доказательств (без coinbase)
 */
[[nodiscard]] Result<std::vector<Hash256>> load_leaves(const Context& ctx) {
    const auto path = pick(ctx.args.leaves, ctx.config.paths.leaf_list);
    auto leaves = io::read_leaf_list(path);
    if (leaves) {
        ctx.logger.debug("Прочитано {} txid из {}", leaves->size(), path.string());
    }
    return leaves;
}

/**
 * @brief Листья заголовка: список txid, при наличии с coinbase в начале
 */
[[nodiscard]] Result<std::vector<Hash256>> load_block_leaves(const Context& ctx) {
    const auto path = pick(ctx.args.leaves, ctx.config.paths.leaf_list);
    std::optional<std::filesystem::path> coinbase;
    if (!ctx.args.no_coinbase) {
        coinbase = pick(ctx.args.coinbase, ctx.config.paths.coinbase_txid);
    }

    auto leaves = io::read_block_leaves(path, coinbase);
    if (leaves) {
        ctx.logger.debug("Листьев заголовка: {} ({})", leaves->size(), path.string());
    }
    return leaves;
}

/**
 * @brief Требуемый txid: --txid, затем REQUIRED_TXID, файл и конфигурация
 */
[[nodiscard]] Result<std::optional<Hash256>> required_txid(const Context& ctx) {
    if (ctx.args.txid) {
        auto txid = hex::decode_hash(hex::normalize(*ctx.args.txid), "--txid");
        if (!txid) {
            return std::unexpected(txid.error());
        }
        return std::optional<Hash256>{*txid};
    }
    return ctx.config.resolve_required_txid();
}

/**
 * @brief Требуемый txid, без которого команда не имеет смысла
 */
[[nodiscard]] Result<Hash256> mandatory_txid(const Context& ctx) {
    auto txid = required_txid(ctx);
    if (!txid) {
        return std::unexpected(txid.error());
    }
    if (!txid->has_value()) {
        return Err<Hash256>(
            ErrorCode::ConfigInvalidValue,
            std::format("Требуемый txid не задан (--txid, {}, {} или merkle.required_txid)",
                        constants::REQUIRED_TXID_ENV,
                        ctx.config.paths.required_txid_file.string())
        );
    }
    return **txid;
}

/**
 * @brief Target из --target или конфигурации
 */
[[nodiscard]] Result<core::uint256> load_target(const Context& ctx) {
    const std::string compact = ctx.args.target
        ? hex::normalize(*ctx.args.target)
        : ctx.config.mining.target;
    auto target = pow::parse_compact_target(compact);
    if (!target) {
        return std::unexpected(target.error());
    }
    ctx.logger.debug("Target {} = {}", compact, target->to_hex());
    return target;
}

// =============================================================================
// Команды
// =============================================================================

Result<Verdict> cmd_root(const Context& ctx) {
    auto leaves = load_leaves(ctx);
    if (!leaves) {
        return std::unexpected(leaves.error());
    }

    auto root = merkle::compute_merkle_root(*leaves);
    if (!root) {
        return std::unexpected(root.error());
    }

    Verdict verdict;
    verdict.note(std::format("Merkle root: {}", hex::encode(*root)));
    verdict.note(std::format("Leaves: {}, height: {}",
                             leaves->size(), merkle::tree_height(leaves->size())));
    return verdict;
}

Result<Verdict> cmd_prove(const Context& ctx) {
    auto leaves = load_leaves(ctx);
    if (!leaves) {
        return std::unexpected(leaves.error());
    }

    Result<merkle::InclusionProof> proof = ctx.args.index
        ? merkle::build_inclusion_proof(*leaves, *ctx.args.index)
        : [&]() -> Result<merkle::InclusionProof> {
              auto txid = mandatory_txid(ctx);
              if (!txid) {
                  return std::unexpected(txid.error());
              }
              return merkle::build_inclusion_proof(*leaves, *txid);
          }();
    if (!proof) {
        return std::unexpected(proof.error());
    }

    const auto out = pick(ctx.args.out, ctx.config.paths.proof);
    if (auto written = io::write_proof(out, proof->root, proof->siblings); !written) {
        return std::unexpected(written.error());
    }

    Verdict verdict;
    verdict.note(std::format("Merkle root: {}", hex::encode(proof->root)));
    verdict.note(std::format("Leaf index: {}", proof->leaf_index));
    for (std::size_t i = 0; i < proof->siblings.size(); ++i) {
        ctx.logger.debug("Sibling {}: {}", i, hex::encode(proof->siblings[i]));
    }
    verdict.note(std::format("Proof depth: {} level(s)", proof->siblings.size()));
    verdict.note(std::format("Wrote: {}", out.string()));
    return verdict;
}

Result<Verdict> cmd_verify(const Context& ctx) {
    auto leaves = load_leaves(ctx);
    if (!leaves) {
        return std::unexpected(leaves.error());
    }

    auto txid = mandatory_txid(ctx);
    if (!txid) {
        return std::unexpected(txid.error());
    }

    auto claim = io::read_proof(pick(ctx.args.proof, ctx.config.paths.proof));
    if (!claim) {
        return std::unexpected(claim.error());
    }

    auto verifier = merkle::Verifier::replay(std::move(*leaves), *txid);
    ctx.logger.debug("Режим проверки: {}", merkle::to_string(verifier.mode()));
    return verifier.verify(*claim);
}

Result<Verdict> cmd_verify_committed(const Context& ctx) {
    auto claim = io::read_proof(pick(ctx.args.proof, ctx.config.paths.proof));
    if (!claim) {
        return std::unexpected(claim.error());
    }

    auto references = io::read_reference_digests(
        pick(ctx.args.reference, ctx.config.paths.reference_digests));
    if (!references) {
        return std::unexpected(references.error());
    }

    auto verifier = merkle::Verifier::committed(std::move(*references));
    ctx.logger.debug("Режим проверки: {}", merkle::to_string(verifier.mode()));
    return verifier.verify(*claim);
}

Result<Verdict> cmd_commit(const Context& ctx) {
    auto leaves = load_leaves(ctx);
    if (!leaves) {
        return std::unexpected(leaves.error());
    }

    auto txid = mandatory_txid(ctx);
    if (!txid) {
        return std::unexpected(txid.error());
    }

    auto proof = merkle::build_inclusion_proof(*leaves, *txid);
    if (!proof) {
        return std::unexpected(proof.error());
    }

    const auto references = merkle::commit_reference(proof->root, proof->siblings);
    const auto out = pick(ctx.args.out, ctx.config.paths.reference_digests);
    if (auto written = io::write_hash_list(out, references); !written) {
        return std::unexpected(written.error());
    }

    Verdict verdict;
    verdict.note(std::format("Root digest: {}", hex::encode(references.front())));
    verdict.note(std::format("Digests: {}", references.size()));
    verdict.note(std::format("Wrote: {}", out.string()));
    return verdict;
}

Result<Verdict> cmd_mine(const Context& ctx) {
    auto leaves = load_block_leaves(ctx);
    if (!leaves) {
        return std::unexpected(leaves.error());
    }

    auto root = merkle::compute_merkle_root(*leaves);
    if (!root) {
        return std::unexpected(root.error());
    }

    auto target = load_target(ctx);
    if (!target) {
        return std::unexpected(target.error());
    }

    const auto& defaults = ctx.config.mining;
    auto prev = hex::decode_hash(
        hex::normalize(ctx.args.prev.value_or(defaults.prev_hash)), "prev_hash");
    if (!prev) {
        return std::unexpected(prev.error());
    }

    mining::HeaderTemplate tmpl;
    tmpl.version = ctx.args.block_version.value_or(defaults.version);
    tmpl.prev_hash = *prev;
    tmpl.merkle_root = *root;
    tmpl.timestamp = ctx.args.time.value_or(defaults.timestamp);
    tmpl.start_nonce = ctx.args.nonce.value_or(defaults.start_nonce);

    mining::MiningParams params;
    params.max_attempts = ctx.args.max_attempts.value_or(defaults.max_attempts);
    params.allow_time_increment = ctx.args.allow_time_increment || defaults.allow_time_increment;

    mining::Miner miner(tmpl, *target, params);

    ctx.logger.info("Merkle root: {}", hex::encode(*root));
    ctx.logger.info("Target:      {}", miner.target().to_hex());
    ctx.logger.info("Перебор: timestamp {}, nonce {}, попыток на timestamp {}{}",
                    tmpl.timestamp, tmpl.start_nonce, params.max_attempts,
                    params.allow_time_increment ? ", сдвиг времени разрешён" : "");

    auto result = miner.run(&g_cancel);
    if (!result) {
        ctx.logger.info("Перебор остановлен ({}), вычислено хешей: {}",
                        mining::to_string(miner.state()), miner.hashes_total());
        return std::unexpected(result.error());
    }

    const auto out = pick(ctx.args.out, ctx.config.paths.header);
    if (auto written = io::write_header(out, result->header); !written) {
        return std::unexpected(written.error());
    }

    ctx.logger.info("Хешей: {}, время: {:.2f} с, скорость: {:.0f} H/s",
                    result->hashes_total, result->elapsed.count(), result->hashrate());

    Verdict verdict;
    verdict.note(std::format("Header (hex): {}", hex::encode(result->encoded)));
    verdict.note(std::format("Block hash  : {}", hex::encode(result->hash)));
    verdict.note(std::format("Target      : {}", target->to_hex()));
    verdict.note(std::format("Nonce       : {}", result->nonce));
    verdict.note(std::format("Time        : {}", result->timestamp));
    verdict.note(std::format("Wrote       : {}", out.string()));
    return verdict;
}

Result<Verdict> cmd_check_header(const Context& ctx) {
    auto header = io::read_header(pick(ctx.args.header, ctx.config.paths.header));
    if (!header) {
        return std::unexpected(header.error());
    }

    auto leaves = load_block_leaves(ctx);
    if (!leaves) {
        return std::unexpected(leaves.error());
    }

    auto target = load_target(ctx);
    if (!target) {
        return std::unexpected(target.error());
    }

    return pow::check_header(*header, *leaves, *target);
}

Result<Verdict> cmd_check_selection(const Context& ctx) {
    auto pool = mempool::load_mempool(pick(ctx.args.mempool, ctx.config.paths.mempool));
    if (!pool) {
        return std::unexpected(pool.error());
    }
    ctx.logger.debug("Мемпул: {} транзакций", pool->size());

    auto selection = mempool::load_selection(
        pick(ctx.args.selection, ctx.config.paths.selection));
    if (!selection) {
        return std::unexpected(selection.error());
    }

    auto required = required_txid(ctx);
    if (!required) {
        return std::unexpected(required.error());
    }
    std::optional<std::string> required_hex;
    if (*required) {
        required_hex = hex::encode(**required);
    } else {
        ctx.logger.warn("Требуемый txid не задан, проверка его наличия пропущена");
    }

    return mempool::check_selection(
        *pool, *selection, required_hex, ctx.config.selection.weight_limit);
}

/**
 * @brief Выполнить команду по имени
 */
Result<Verdict> dispatch(const Context& ctx) {
    const std::string& name = ctx.args.command;

    if (name == "root") return cmd_root(ctx);
    if (name == "prove") return cmd_prove(ctx);
    if (name == "verify") return cmd_verify(ctx);
    if (name == "verify-committed") return cmd_verify_committed(ctx);
    if (name == "commit") return cmd_commit(ctx);
    if (name == "mine") return cmd_mine(ctx);
    if (name == "check-header") return cmd_check_header(ctx);
    if (name == "check-selection") return cmd_check_selection(ctx);

    return Err<Verdict>(
        ErrorCode::ConfigInvalidValue,
        name.empty() ? std::string("Не указана команда (см. --help)")
                     : std::format("Неизвестная команда: {}", name)
    );
}

/**
 * @brief Загрузить конфигурацию; без файла используются значения по умолчанию
 */
Result<Config> load_config(const Args& args, log::Logger& logger) {
    auto config = args.config_path
        ? Config::load(*args.config_path)
        : Config::load_with_search();

    if (!config) {
        if (args.config_path || config.error().code != ErrorCode::ConfigNotFound) {
            return std::unexpected(config.error());
        }
        logger.debug("Файл конфигурации не найден, используются значения по умолчанию");
        config = Config{};
    }

    if (auto validation = config->validate(); !validation) {
        return Err<Config>(
            validation.error().code,
            std::format("Ошибка валидации конфигурации: {}", validation.error().message)
        );
    }
    return config;
}

} // anonymous namespace

/**
 * @brief Главная функция
 */
int main(int argc, char* argv[]) {
    using namespace proofsmith;

    log::Logger logger;

    auto args = parse_args(argc, argv);
    if (!args) {
        logger.error("{}", args.error().message);
        return EXIT_INPUT_ERROR;
    }

    if (args->show_help) {
        print_help();
        return EXIT_OK;
    }

    if (args->show_version) {
        print_version();
        return EXIT_OK;
    }

    auto config = load_config(*args, logger);
    if (!config) {
        logger.error("{}", config.error().message);
        return exit_code(category(config.error().code));
    }

    // Уровень и цвет: аргументы важнее конфигурации
    logger.set_level(log::parse_level(config->logging.level).value_or(log::LogLevel::Info));
    logger.set_color(config->logging.color && !args->no_color);
    if (args->quiet) {
        logger.set_level(log::LogLevel::Error);
    } else if (args->verbose) {
        logger.set_level(log::LogLevel::Debug);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const Context ctx{*args, *config, logger};

    try {
        auto verdict = dispatch(ctx);

        if (!verdict) {
            const Error& error = verdict.error();
            const ErrorCategory cat = category(error.code);
            logger.error("[{}] {}", to_string(cat), error.message);
            return exit_code(cat);
        }

        if (!verdict->accepted()) {
            for (const auto& failure : verdict->failures) {
                logger.error("FAIL: {}", failure.message);
            }
            return EXIT_REJECTED;
        }

        logger.info("OK");
        for (const auto& line : verdict->details) {
            std::cout << line << '\n';
        }
        std::cout.flush();
        return EXIT_OK;

    } catch (const ConsistencyError& e) {
        logger.error("Внутреннее противоречие: {}", e.what());
        return EXIT_CONSISTENCY;
    }
}
