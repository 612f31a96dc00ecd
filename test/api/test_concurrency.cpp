#include <catch2/catch_template_test_macros.hpp>
#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <recode/recode.hpp>
#include <string>
#include <thread>
#include <vector>

#include "../test_types.hpp"

using namespace Recode;

TEMPLATE_TEST_CASE("Concurrency: one transcoder shared by many threads",
                   "[concurrency]", JsonTranscoder, MsgPackTranscoder,
                   CborTranscoder) {
    const auto transcoder = MakeTestTranscoder<TestType>();
    constexpr std::size_t kThreads = 8;
    constexpr std::size_t kIterations = 200;

    std::atomic<std::size_t> failures{0};
    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (std::size_t t = 0; t < kThreads; ++t) {
        threads.emplace_back([&transcoder, &failures, t] {
            for (std::size_t i = 0; i < kIterations; ++i) {
                const auto n = static_cast<std::int64_t>(i);
                const Value value = Value::Mapping{
                    {"thread", static_cast<std::int64_t>(t)},
                    {"tuple", Value::Of(Tuple{n, "x"})},
                    {"str", Value::Of(MyStr{std::to_string(i)})},
                };
                auto bytes = transcoder.Encode(value);
                if (!bytes) {
                    ++failures;
                    continue;
                }
                auto copy = transcoder.Decode(*bytes);
                if (!copy || *copy != value) {
                    ++failures;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(failures == 0);
}
