#include "celestiada/sdk/NamespacedMerkleTree.hpp"
#include "celestiada/sdk/KeyValueStore.hpp"
#include "celestiada/sdk/Namespace.hpp"
#include "test_util.hpp"

#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <map>
#include <string>
#include <vector>

using namespace celestiada::sdk;

namespace {

ByteVector namespace_bytes(uint8_t user_id) {
    return Namespace::from_v0(ByteVector{user_id}).value().bytes();
}

// Namespace prefix, payload, zero padding up to the share size
ByteVector make_share(const ByteVector& ns, const std::string& payload) {
    ByteVector share(ns);
    share.insert(share.end(), payload.begin(), payload.end());
    share.resize(constants::SHARE_SIZE, 0x00);
    return share;
}

std::vector<ByteVector> abcd_shares() {
    ByteVector ns = namespace_bytes(0x01);
    return {make_share(ns, "a"), make_share(ns, "b"), make_share(ns, "c"), make_share(ns, "d")};
}

using PreimageMap = std::map<Hash32, ByteVector>;

PreimageRecorder map_recorder(PreimageMap& preimages, size_t* calls = nullptr) {
    return [&preimages, calls](const Hash32& digest, const ByteVector& preimage) {
        preimages[digest] = preimage;
        if (calls) {
            ++*calls;
        }
        return Result<void>();
    };
}

PreimageOracle map_oracle(const PreimageMap& preimages) {
    return [&preimages](const Hash32& digest) -> Result<ByteVector> {
        auto it = preimages.find(digest);
        if (it == preimages.end()) {
            return {ErrorCode::NOT_FOUND, bytes_to_hex(digest)};
        }
        return it->second;
    };
}

ByteVector root_hash(const ByteVector& root) {
    return ByteVector(root.end() - constants::HASH_SIZE, root.end());
}

} // namespace

BOOST_AUTO_TEST_SUITE(nmt_tests)

BOOST_AUTO_TEST_CASE(abcd_known_root)
{
    PreimageMap preimages;
    auto root = NamespacedMerkleTree::compute_root(abcd_shares(), map_recorder(preimages));
    BOOST_REQUIRE(root.is_ok());
    BOOST_REQUIRE_EQUAL(root.value().size(), constants::NMT_NODE_SIZE);

    ByteVector ns = namespace_bytes(0x01);
    BOOST_CHECK(ByteVector(root.value().begin(), root.value().begin() + 29) == ns);
    BOOST_CHECK(ByteVector(root.value().begin() + 29, root.value().begin() + 58) == ns);
    BOOST_CHECK_EQUAL(bytes_to_hex(root_hash(root.value())),
                      "e7af77705c07d3bb17186edd16da92d91548a0c97753b4bce2a8569b02db266b");
}

BOOST_AUTO_TEST_CASE(uneven_tree_splits_at_power_of_two)
{
    std::vector<ByteVector> shares = {
        make_share(namespace_bytes(0x01), "a"),
        make_share(namespace_bytes(0x02), "b"),
        make_share(namespace_bytes(0x03), "c"),
    };

    PreimageMap preimages;
    auto root = NamespacedMerkleTree::compute_root(shares, map_recorder(preimages));
    BOOST_REQUIRE(root.is_ok());

    BOOST_CHECK(ByteVector(root.value().begin(), root.value().begin() + 29) == namespace_bytes(0x01));
    BOOST_CHECK(ByteVector(root.value().begin() + 29, root.value().begin() + 58) == namespace_bytes(0x03));
    BOOST_CHECK_EQUAL(bytes_to_hex(root_hash(root.value())),
                      "09a69030014ab51369c5558f4bb37a040e5f3a70ed44b8bc95a8788255ad7d59");
}

BOOST_AUTO_TEST_CASE(records_every_digest_once)
{
    std::vector<ByteVector> shares = abcd_shares();
    shares.push_back(make_share(namespace_bytes(0x01), "e"));

    PreimageMap preimages;
    size_t calls = 0;
    auto root = NamespacedMerkleTree::compute_root(shares, map_recorder(preimages, &calls));
    BOOST_REQUIRE(root.is_ok());

    // n leaves and n - 1 inner nodes
    BOOST_CHECK_EQUAL(calls, 2 * shares.size() - 1);
    BOOST_CHECK_EQUAL(preimages.size(), 2 * shares.size() - 1);

    for (const auto& entry : preimages) {
        BOOST_CHECK(NmtHasher::sha256(entry.second) == entry.first);
    }
}

BOOST_AUTO_TEST_CASE(root_is_deterministic)
{
    PreimageMap first;
    PreimageMap second;
    auto root1 = NamespacedMerkleTree::compute_root(abcd_shares(), map_recorder(first));
    auto root2 = NamespacedMerkleTree::compute_root(abcd_shares(), map_recorder(second));
    BOOST_REQUIRE(root1.is_ok());
    BOOST_REQUIRE(root2.is_ok());
    BOOST_CHECK(root1.value() == root2.value());
    BOOST_CHECK(first == second);
}

BOOST_AUTO_TEST_CASE(abcd_reconstructs_in_order)
{
    MemoryKeyValueStore store;
    std::vector<ByteVector> shares = abcd_shares();

    auto root = NamespacedMerkleTree::compute_root(shares, make_preimage_recorder(store));
    BOOST_REQUIRE(root.is_ok());

    auto content = NamespacedMerkleTree::reconstruct_content(make_preimage_oracle(store), root.value());
    BOOST_REQUIRE(content.is_ok());
    BOOST_REQUIRE_EQUAL(content.value().size(), 4u);
    for (size_t i = 0; i < shares.size(); i++) {
        BOOST_CHECK(content.value()[i] == shares[i]);
    }
    BOOST_CHECK_EQUAL(content.value()[2][29], 'c');
}

BOOST_AUTO_TEST_CASE(reconstruction_inverts_root_for_many_sizes)
{
    for (size_t n = 1; n <= 9; n++) {
        std::vector<ByteVector> shares;
        for (size_t i = 0; i < n; i++) {
            shares.push_back(make_share(namespace_bytes(static_cast<uint8_t>(1 + i / 3)),
                                        "share-" + std::to_string(i)));
        }

        PreimageMap preimages;
        auto root = NamespacedMerkleTree::compute_root(shares, map_recorder(preimages));
        BOOST_REQUIRE(root.is_ok());

        auto content = NamespacedMerkleTree::reconstruct_content(map_oracle(preimages), root.value());
        BOOST_REQUIRE(content.is_ok());
        BOOST_CHECK(content.value() == shares);
    }
}

BOOST_AUTO_TEST_CASE(max_namespace_excluded_from_range)
{
    ByteVector max_ns(constants::NAMESPACE_SIZE, constants::MAX_NAMESPACE_BYTE);
    std::vector<ByteVector> shares = {
        make_share(namespace_bytes(0x01), "a"),
        make_share(namespace_bytes(0x02), "b"),
        make_share(max_ns, "parity"),
    };

    PreimageMap preimages;
    auto root = NamespacedMerkleTree::compute_root(shares, map_recorder(preimages));
    BOOST_REQUIRE(root.is_ok());
    BOOST_CHECK(ByteVector(root.value().begin() + 29, root.value().begin() + 58) == namespace_bytes(0x02));

    auto content = NamespacedMerkleTree::reconstruct_content(map_oracle(preimages), root.value());
    BOOST_REQUIRE(content.is_ok());
    BOOST_CHECK(content.value() == shares);
}

BOOST_AUTO_TEST_CASE(empty_input_rejected)
{
    PreimageMap preimages;
    auto root = NamespacedMerkleTree::compute_root(std::vector<ByteVector>(), map_recorder(preimages));
    BOOST_CHECK(root.error() == ErrorCode::INVALID_PARAMETER);
}

BOOST_AUTO_TEST_CASE(any_absent_share_is_incomplete)
{
    for (size_t n = 1; n <= 5; n++) {
        for (size_t missing = 0; missing < n; missing++) {
            ShareList shares;
            for (size_t i = 0; i < n; i++) {
                shares.push_back(make_share(namespace_bytes(0x01), std::to_string(i)));
            }
            shares[missing].reset();

            size_t calls = 0;
            PreimageMap preimages;
            auto root = NamespacedMerkleTree::compute_root(shares, map_recorder(preimages, &calls));
            BOOST_CHECK(root.error() == ErrorCode::INCOMPLETE_INPUT);
            BOOST_CHECK_EQUAL(calls, 0u);
        }
    }
}

BOOST_AUTO_TEST_CASE(unordered_namespaces_rejected)
{
    std::vector<ByteVector> shares = {
        make_share(namespace_bytes(0x02), "b"),
        make_share(namespace_bytes(0x01), "a"),
    };

    PreimageMap preimages;
    auto root = NamespacedMerkleTree::compute_root(shares, map_recorder(preimages));
    BOOST_CHECK(root.error() == ErrorCode::INVALID_PARAMETER);
}

BOOST_AUTO_TEST_CASE(short_share_rejected)
{
    std::vector<ByteVector> shares = {ByteVector(10, 0x00)};

    PreimageMap preimages;
    auto root = NamespacedMerkleTree::compute_root(shares, map_recorder(preimages));
    BOOST_CHECK(root.error() == ErrorCode::INVALID_PARAMETER);
}

BOOST_AUTO_TEST_CASE(recorder_failure_aborts)
{
    PreimageRecorder failing = [](const Hash32&, const ByteVector&) {
        return Result<void>(ErrorCode::STORAGE_ERROR, "disk full");
    };

    auto root = NamespacedMerkleTree::compute_root(abcd_shares(), failing);
    BOOST_CHECK(root.error() == ErrorCode::STORAGE_ERROR);
    BOOST_CHECK_EQUAL(root.error_detail(), "disk full");
}

BOOST_AUTO_TEST_CASE(each_missing_preimage_is_reported)
{
    std::vector<ByteVector> shares = abcd_shares();
    shares.push_back(make_share(namespace_bytes(0x02), "e"));
    shares.push_back(make_share(namespace_bytes(0x03), "f"));

    PreimageMap preimages;
    auto root = NamespacedMerkleTree::compute_root(shares, map_recorder(preimages));
    BOOST_REQUIRE(root.is_ok());

    for (const auto& entry : preimages) {
        PreimageMap damaged = preimages;
        damaged.erase(entry.first);

        auto content = NamespacedMerkleTree::reconstruct_content(map_oracle(damaged), root.value());
        BOOST_CHECK(content.error() == ErrorCode::MISSING_PREIMAGE);
        BOOST_CHECK_EQUAL(content.error_detail(), bytes_to_hex(entry.first));
    }
}

BOOST_AUTO_TEST_CASE(oracle_failure_propagates)
{
    PreimageMap preimages;
    auto root = NamespacedMerkleTree::compute_root(abcd_shares(), map_recorder(preimages));
    BOOST_REQUIRE(root.is_ok());

    PreimageOracle failing = [](const Hash32&) {
        return Result<ByteVector>(ErrorCode::FILE_IO_ERROR, "unreadable");
    };
    auto content = NamespacedMerkleTree::reconstruct_content(failing, root.value());
    BOOST_CHECK(content.error() == ErrorCode::FILE_IO_ERROR);
}

BOOST_AUTO_TEST_CASE(malformed_node_preimage_rejected)
{
    PreimageMap preimages;
    auto root = NamespacedMerkleTree::compute_root(abcd_shares(), map_recorder(preimages));
    BOOST_REQUIRE(root.is_ok());

    Hash32 root_digest;
    std::copy(root.value().end() - constants::HASH_SIZE, root.value().end(), root_digest.begin());
    preimages[root_digest] = ByteVector{constants::NMT_NODE_PREFIX, 0x02, 0x03};

    auto content = NamespacedMerkleTree::reconstruct_content(map_oracle(preimages), root.value());
    BOOST_CHECK(content.error() == ErrorCode::FORMAT_ERROR);

    ByteVector short_root(root.value().begin(), root.value().end() - 1);
    BOOST_CHECK(NamespacedMerkleTree::reconstruct_content(map_oracle(preimages), short_root).error() ==
                ErrorCode::FORMAT_ERROR);
}

BOOST_AUTO_TEST_CASE(file_store_as_preimage_relation)
{
    // Preimages survive a round trip through the file-backed store
    celestiada::test::TempDirectory dir;

    std::vector<ByteVector> shares = abcd_shares();
    ByteVector root;
    {
        LocalFileStorageService store(dir.str());
        auto result = NamespacedMerkleTree::compute_root(shares, make_preimage_recorder(store));
        BOOST_REQUIRE(result.is_ok());
        root = result.value();
    }

    LocalFileStorageService reopened(dir.str());
    auto content = NamespacedMerkleTree::reconstruct_content(make_preimage_oracle(reopened), root);
    BOOST_REQUIRE(content.is_ok());
    BOOST_CHECK(content.value() == shares);
}

BOOST_AUTO_TEST_SUITE_END()
