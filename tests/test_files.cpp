/**
 * @file test_files.cpp
 * @brief Тесты чтения и записи файлов
 */

#include <gtest/gtest.h>
#include <array>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "io/files.hpp"
#include "merkle/merkle_tree.hpp"
#include "merkle/proof.hpp"
#include "merkle/verifier.hpp"
#include "mining/miner.hpp"
#include "pow/header_checker.hpp"
#include "pow/target.hpp"
#include "crypto/sha256.hpp"
#include "core/hex.hpp"
#include "core/types.hpp"

namespace proofsmith::tests {

namespace fs = std::filesystem;

class FilesTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / "proofsmith_files_test";
        fs::remove_all(dir_);
        fs::create_directories(dir_);

        for (uint8_t i = 0; i < 3; ++i) {
            std::array<uint8_t, 1> seed{i};
            hashes_.push_back(crypto::sha256(seed));
        }
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    fs::path write(const std::string& name, const std::string& content) {
        fs::path path = dir_ / name;
        std::ofstream(path) << content;
        return path;
    }

    fs::path dir_;
    std::vector<Hash256> hashes_;
};

/**
 * @brief Тест: пробелы, пустые строки и регистр игнорируются
 */
TEST_F(FilesTest, ReadLeafListNormalizes) {
    std::string upper = hex::encode(hashes_[1]);
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    auto path = write("leaves.txt",
                      "  " + hex::encode(hashes_[0]) + "  \r\n\n" + upper + "\n");

    auto leaves = io::read_leaf_list(path);
    ASSERT_TRUE(leaves.has_value()) << leaves.error().message;
    ASSERT_EQ(leaves->size(), 2u);
    EXPECT_EQ((*leaves)[0], hashes_[0]);
    EXPECT_EQ((*leaves)[1], hashes_[1]);
}

/**
 * @brief Тест: ошибка указывает файл и номер строки
 */
TEST_F(FilesTest, ReadLeafListReportsLine) {
    auto path = write("bad.txt", hex::encode(hashes_[0]) + "\n\nabcd\n");

    auto leaves = io::read_leaf_list(path);
    ASSERT_FALSE(leaves.has_value());
    EXPECT_EQ(leaves.error().code, ErrorCode::Length);
    EXPECT_NE(leaves.error().message.find("bad.txt:3:"), std::string::npos);

    auto invalid = io::read_leaf_list(write("hex.txt", std::string(64, 'z') + "\n"));
    ASSERT_FALSE(invalid.has_value());
    EXPECT_EQ(invalid.error().code, ErrorCode::InvalidHex);
}

/**
 * @brief Тест: пустой и отсутствующий файл
 */
TEST_F(FilesTest, EmptyAndMissing) {
    auto empty = io::read_leaf_list(write("empty.txt", "\n \n"));
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code, ErrorCode::EmptyInput);

    auto missing = io::read_leaf_list(dir_ / "nope.txt");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::IoError);
}

/**
 * @brief Тест: доказательство записывается и читается обратно
 */
TEST_F(FilesTest, ProofFile) {
    fs::path path = dir_ / "nested" / "proof.txt";
    std::vector<Hash256> siblings{hashes_[1], hashes_[2]};
    ASSERT_TRUE(io::write_proof(path, hashes_[0], siblings).has_value());

    auto claim = io::read_proof(path);
    ASSERT_TRUE(claim.has_value());
    EXPECT_EQ(claim->root, hashes_[0]);
    EXPECT_EQ(claim->siblings, siblings);

    // Только корень: доказательство для дерева из одного листа
    auto root_only = io::read_proof(write("root.txt", hex::encode(hashes_[2]) + "\n"));
    ASSERT_TRUE(root_only.has_value());
    EXPECT_TRUE(root_only->siblings.empty());
}

/**
 * @brief Тест: список дайджестов
 */
TEST_F(FilesTest, HashList) {
    fs::path path = dir_ / "digests.txt";
    ASSERT_TRUE(io::write_hash_list(path, hashes_).has_value());

    auto digests = io::read_reference_digests(path);
    ASSERT_TRUE(digests.has_value());
    EXPECT_EQ(*digests, hashes_);
}

/**
 * @brief Тест: файл заголовка
 */
TEST_F(FilesTest, HeaderFile) {
    core::BlockHeader header;
    header.version = 4;
    header.prev_hash = hashes_[0];
    header.merkle_root = hashes_[1];
    header.timestamp = 1230999306;
    header.nonce = 42;

    fs::path path = dir_ / "header.txt";
    ASSERT_TRUE(io::write_header(path, header).has_value());

    auto loaded = io::read_header(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, header);

    auto short_header = io::read_header(write("short.txt", "00ff\n"));
    ASSERT_FALSE(short_header.has_value());
    EXPECT_EQ(short_header.error().code, ErrorCode::Length);
}

/**
 * @brief Тест: coinbase необязателен и добавляется в начало
 */
TEST_F(FilesTest, Coinbase) {
    auto absent = io::read_coinbase_txid(dir_ / "coinbase.txt");
    ASSERT_TRUE(absent.has_value());
    EXPECT_FALSE(absent->has_value());

    auto present = io::read_coinbase_txid(
        write("coinbase.txt", "\n" + hex::encode(hashes_[2]) + "\n"));
    ASSERT_TRUE(present.has_value());
    ASSERT_TRUE(present->has_value());
    EXPECT_EQ(**present, hashes_[2]);

    auto leaves = io::prepend_coinbase({hashes_[0], hashes_[1]}, *present);
    ASSERT_EQ(leaves.size(), 3u);
    EXPECT_EQ(leaves[0], hashes_[2]);
    EXPECT_EQ(leaves[1], hashes_[0]);

    auto unchanged = io::prepend_coinbase({hashes_[0]}, std::nullopt);
    EXPECT_EQ(unchanged.size(), 1u);

    auto broken = io::read_coinbase_txid(write("broken.txt", "xyz\n"));
    ASSERT_FALSE(broken.has_value());
}

/**
 * @brief Тест: coinbase попадает только в листья заголовка
 *
 * Дерево доказательства строится по списку txid как есть, даже если рядом
 * лежит файл coinbase; заголовок строится и проверяется с coinbase первым.
 */
TEST_F(FilesTest, CoinbaseOnlyInBlockLeaves) {
    auto leaf_path = write("leaves.txt",
                           hex::encode(hashes_[0]) + "\n" + hex::encode(hashes_[1]) + "\n");
    std::array<uint8_t, 2> seed{0xc0, 0x1b};
    const Hash256 coinbase = crypto::sha256(seed);
    auto coinbase_path = write("coinbase.txt", hex::encode(coinbase) + "\n");

    // Доказательство: сырой список, coinbase не читается
    auto raw = io::read_leaf_list(leaf_path);
    ASSERT_TRUE(raw.has_value());
    ASSERT_EQ(raw->size(), 2u);

    auto proof = merkle::build_inclusion_proof(*raw, hashes_[1]);
    ASSERT_TRUE(proof.has_value());
    EXPECT_EQ(proof->leaf_index, 1u);
    ASSERT_EQ(proof->siblings.size(), 1u);
    EXPECT_EQ(proof->siblings[0], hashes_[0]);

    auto verdict = merkle::Verifier::replay(*raw, hashes_[1])
                       .verify(merkle::ProofClaim{proof->root, proof->siblings});
    ASSERT_TRUE(verdict.has_value());
    EXPECT_TRUE(verdict->accepted());

    // Заголовок: coinbase первым листом
    auto block = io::read_block_leaves(leaf_path, coinbase_path);
    ASSERT_TRUE(block.has_value());
    ASSERT_EQ(block->size(), 3u);
    EXPECT_EQ((*block)[0], coinbase);
    EXPECT_EQ((*block)[1], hashes_[0]);

    auto without = io::read_block_leaves(leaf_path, std::nullopt);
    ASSERT_TRUE(without.has_value());
    EXPECT_EQ(*without, *raw);

    auto absent = io::read_block_leaves(leaf_path, dir_ / "no_coinbase.txt");
    ASSERT_TRUE(absent.has_value());
    EXPECT_EQ(*absent, *raw);

    mining::HeaderTemplate tmpl;
    tmpl.merkle_root = *merkle::compute_merkle_root(*block);
    tmpl.timestamp = 1230999306;
    auto target = *pow::parse_compact_target("207fffff");
    mining::Miner miner(tmpl, target, mining::MiningParams{});
    auto mined = miner.run();
    ASSERT_TRUE(mined.has_value());

    auto with_coinbase = pow::check_header(mined->header, *block, target);
    ASSERT_TRUE(with_coinbase.has_value());
    EXPECT_TRUE(with_coinbase->accepted());

    auto without_coinbase = pow::check_header(mined->header, *raw, target);
    ASSERT_TRUE(without_coinbase.has_value());
    ASSERT_FALSE(without_coinbase->accepted());
    EXPECT_EQ(without_coinbase->failures[0].code, ErrorCode::RootMismatch);
}

} // namespace proofsmith::tests
