#include <catch2/catch_test_macros.hpp>
#include "beacon/messaging/envelope_codec.hpp"
#include "beacon/messaging/hybrid_payload_cipher.hpp"
#include "beacon/messaging/msg_id.hpp"
#include "helpers/test_identities.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

using namespace beacon::node;
using namespace beacon::node::messaging;
using namespace beacon::node::test_helpers;

TEST_CASE("Concurrency - Parallel MsgId generation", "[concurrency][envelope][msg_id]") {
    constexpr int THREAD_COUNT = 32;
    constexpr int IDS_PER_THREAD = 2000;

    std::unordered_set<MsgId> ids;
    std::mutex ids_mutex;
    std::atomic<bool> collision_detected{false};

    std::vector<std::thread> threads;
    threads.reserve(THREAD_COUNT);
    for (int t = 0; t < THREAD_COUNT; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < IDS_PER_THREAD; ++i) {
                const MsgId id = MsgId::Generate();
                std::lock_guard<std::mutex> lock(ids_mutex);
                if (!ids.insert(id).second) {
                    collision_detected.store(true);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE_FALSE(collision_detected.load());
    REQUIRE(ids.size() == static_cast<size_t>(THREAD_COUNT * IDS_PER_THREAD));
}

TEST_CASE("Concurrency - Shared cipher across threads", "[concurrency][envelope][cipher]") {
    const auto directory = DirectoryOf({&NodeAlpha(), &NodeBravo()});
    const HybridPayloadCipher alpha(LoadTestIdentity(NodeAlpha(), *directory), directory);
    const HybridPayloadCipher bravo(LoadTestIdentity(NodeBravo(), *directory), directory);
    const auto alpha_id = NodeId::Create(NodeAlpha().node_id).Unwrap();
    const auto bravo_id = NodeId::Create(NodeBravo().node_id).Unwrap();

    SECTION("8 threads sealing and opening 25 envelopes each") {
        constexpr int THREAD_COUNT = 8;
        constexpr int ENVELOPES_PER_THREAD = 25;

        std::atomic<int> opened{0};
        std::atomic<int> failures{0};
        std::unordered_set<std::string> blobs;
        std::mutex blobs_mutex;

        std::vector<std::thread> threads;
        threads.reserve(THREAD_COUNT);
        for (int t = 0; t < THREAD_COUNT; ++t) {
            threads.emplace_back([&, t]() {
                for (int i = 0; i < ENVELOPES_PER_THREAD; ++i) {
                    const std::string body = "thread " + std::to_string(t) + " message " + std::to_string(i);
                    auto envelope = PlainEnvelope::Create(alpha_id, {bravo_id}, body);
                    if (envelope.IsErr()) {
                        failures.fetch_add(1);
                        continue;
                    }
                    auto sealed = Encrypt(std::move(envelope).Unwrap(), alpha);
                    if (sealed.IsErr()) {
                        failures.fetch_add(1);
                        continue;
                    }
                    {
                        std::lock_guard<std::mutex> lock(blobs_mutex);
                        blobs.insert(sealed.Unwrap().Ciphertext());
                    }
                    auto wire = EnvelopeCodec::EncodeForTransmission(sealed.Unwrap());
                    if (wire.IsErr()) {
                        failures.fetch_add(1);
                        continue;
                    }
                    auto received = EnvelopeCodec::FromJson<Encrypted>(wire.Unwrap());
                    if (received.IsErr()) {
                        failures.fetch_add(1);
                        continue;
                    }
                    auto plain = Decrypt(std::move(received).Unwrap(), bravo);
                    if (plain.IsOk() && plain.Unwrap().Body() == body) {
                        opened.fetch_add(1);
                    } else {
                        failures.fetch_add(1);
                    }
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(failures.load() == 0);
        REQUIRE(opened.load() == THREAD_COUNT * ENVELOPES_PER_THREAD);
        REQUIRE(blobs.size() == static_cast<size_t>(THREAD_COUNT * ENVELOPES_PER_THREAD));
    }

    SECTION("Non-recipient fails consistently under contention") {
        const std::vector<NodeId> to = {alpha_id};
        auto sealed = alpha.Encrypt(Plain{"for alpha only"}, to);
        REQUIRE(sealed.IsOk());
        const Encrypted blob = sealed.Unwrap();

        constexpr int THREAD_COUNT = 8;
        std::atomic<int> rejected{0};
        std::atomic<int> accepted{0};
        std::vector<std::thread> threads;
        threads.reserve(THREAD_COUNT * 2);
        for (int t = 0; t < THREAD_COUNT; ++t) {
            threads.emplace_back([&]() {
                if (bravo.Decrypt(blob).IsErr()) {
                    rejected.fetch_add(1);
                }
            });
            threads.emplace_back([&]() {
                if (alpha.Decrypt(blob).IsOk()) {
                    accepted.fetch_add(1);
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(rejected.load() == THREAD_COUNT);
        REQUIRE(accepted.load() == THREAD_COUNT);
    }
}
