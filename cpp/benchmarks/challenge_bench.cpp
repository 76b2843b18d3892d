#include <string>

#include <benchmark/benchmark.h>

#include "snap/security/challenge.hpp"
#include "snap/security/id.hpp"

namespace {
snap::core::SecretId make_id_seq(snap::core::u8 start) {
    snap::core::SecretId id{};
    for (size_t i = 0; i < id.b.size(); ++i) {
        id.b[i] = static_cast<snap::core::u8>(start + i);
    }
    return id;
}
} // namespace

static void BM_ChallengeDigest(benchmark::State& state) {
    const auto id = make_id_seq(1);
    const std::string answer(static_cast<size_t>(state.range(0)), 'b');
    for (auto _ : state) {
        snap::core::Hash256 out{};
        const snap::core::Status s =
            snap::security::challenge_digest(id, answer, snap::core::AnswerMatch::Exact, &out);
        benchmark::DoNotOptimize(s.code);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_ChallengeDigest)->Arg(4)->Arg(64)->Arg(1000);

static void BM_ChallengeMatches(benchmark::State& state) {
    const auto id = make_id_seq(7);
    const auto match = state.range(0) == 0 ? snap::core::AnswerMatch::Exact
                                           : snap::core::AnswerMatch::IgnoreAsciiCase;
    snap::core::Hash256 stored{};
    if (!snap::core::is_ok(snap::security::challenge_digest(id, "Blue", match, &stored))) {
        state.SkipWithError("digest failed");
        return;
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(snap::security::challenge_matches(stored, id, "blue", match));
    }
}
BENCHMARK(BM_ChallengeMatches)->Arg(0)->Arg(1);

static void BM_SecretIdLookupKey(benchmark::State& state) {
    const auto id = make_id_seq(3);
    for (auto _ : state) {
        benchmark::DoNotOptimize(snap::security::secret_id_lookup_key(id));
    }
}
BENCHMARK(BM_SecretIdLookupKey);

static void BM_SecretIdHexRoundTrip(benchmark::State& state) {
    const auto id = make_id_seq(5);
    for (auto _ : state) {
        const std::string hex = snap::security::secret_id_to_hex(id);
        snap::core::SecretId back{};
        benchmark::DoNotOptimize(snap::security::secret_id_from_hex(hex, &back));
        benchmark::DoNotOptimize(back);
    }
}
BENCHMARK(BM_SecretIdHexRoundTrip);
