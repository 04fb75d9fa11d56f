#include <gtest/gtest.h>
#include <tickhook/cpu_features.hpp>
#include <tickhook/predicate_matcher.hpp>

#include <random>
#include <vector>

using namespace tickhook;

namespace {

RegisteredHook make_hook(HookId id, TermPattern predicate,
                         std::optional<TermPattern> subject = std::nullopt,
                         std::optional<TermPattern> object = std::nullopt) {
    HookEntry entry;
    entry.id = id;
    entry.name = "hook_" + std::to_string(id);
    entry.operation_kind = OperationKind::ParallelSplit;
    entry.predicate_pattern = predicate;
    entry.subject_pattern = subject;
    entry.object_pattern = object;

    Branch branch;
    branch.name = "noop";
    branch.handler = [](const BranchContext&) { return BranchOutcome::Done; };
    return RegisteredHook{entry, {branch}};
}

Event make_event(EventId id, Term s, Term p, Term o) {
    Event e;
    e.id = id;
    e.subject = s;
    e.predicate = p;
    e.object = o;
    return e;
}

std::vector<MatcherBackend> supported_vector_backends() {
    std::vector<MatcherBackend> backends;
    for (MatcherBackend b : {MatcherBackend::Narrow, MatcherBackend::Wide}) {
        if (PredicateMatcher::backend_supported(b)) {
            backends.push_back(b);
        }
    }
    return backends;
}

// Flips bit 0 whenever anything matched
void faulty_screen(const Term* values, const uint64_t* wildcards,
                   size_t count, Term predicate, HookMask& out) {
    screen_scalar(values, wildcards, count, predicate, out);
    if (count > 0) {
        if (out.test(0)) out.clear(0); else out.set(0);
    }
}

} // namespace

// =============================================================================
// Screen differential
// =============================================================================

TEST(PredicateScreenTest, VectorScreensMatchScalarForEveryWidth) {
    std::mt19937_64 rng(0x7ac4b00c);
    auto backends = supported_vector_backends();
    if (backends.empty()) {
        GTEST_SKIP() << "No vector backend on " << CpuFeatures::get().arch_name;
    }

    for (size_t count = 0; count <= MAX_HOOKS; ++count) {
        size_t padded = (count + HookSnapshot::SCREEN_GROUP - 1) / HookSnapshot::SCREEN_GROUP
                        * HookSnapshot::SCREEN_GROUP;
        std::vector<Term> values(padded == 0 ? 4 : padded, 0);
        std::vector<uint64_t> wildcards(values.size(), 0);

        for (int round = 0; round < 8; ++round) {
            for (size_t i = 0; i < count; ++i) {
                values[i] = rng() % 5;  // Small domain forces many equal predicates
                wildcards[i] = (rng() % 7 == 0) ? ~uint64_t{0} : 0;
            }
            // Padding that would match must still be cut off
            for (size_t i = count; i < values.size(); ++i) {
                values[i] = 0;
                wildcards[i] = ~uint64_t{0};
            }

            Term predicate = rng() % 5;
            HookMask reference;
            screen_scalar(values.data(), wildcards.data(), count, predicate, reference);

            for (MatcherBackend backend : backends) {
                HookMask vectored;
                PredicateMatcher::screen_for(backend)(values.data(), wildcards.data(),
                                                      count, predicate, vectored);
                ASSERT_EQ(vectored, reference)
                    << matcher_backend_name(backend) << " count=" << count
                    << " predicate=" << predicate;
            }
        }
    }
}

TEST(PredicateScreenTest, ExtremeValuesCompareExactly) {
    std::vector<Term> values = {0, UINT64_MAX, 0x8000000000000000ULL, 1};
    std::vector<uint64_t> wildcards(4, 0);

    for (Term predicate : values) {
        HookMask reference;
        screen_scalar(values.data(), wildcards.data(), 4, predicate, reference);
        EXPECT_EQ(reference.popcount(), 1u);
        for (MatcherBackend backend : supported_vector_backends()) {
            HookMask vectored;
            PredicateMatcher::screen_for(backend)(values.data(), wildcards.data(),
                                                  4, predicate, vectored);
            EXPECT_EQ(vectored, reference) << matcher_backend_name(backend);
        }
    }
}

// =============================================================================
// Matcher over snapshots
// =============================================================================

TEST(PredicateMatcherTest, AutoPicksBestAvailable) {
    PredicateMatcher matcher;
    EXPECT_EQ(matcher.backend(), PredicateMatcher::best_available());
    EXPECT_NE(matcher.backend(), MatcherBackend::Auto);
}

TEST(PredicateMatcherTest, EmptySnapshotGivesEmptyMask) {
    HookSnapshot snapshot(1, {});
    PredicateMatcher matcher;
    HookMask mask = matcher.match_predicate(make_event(1, 1, 2, 3), snapshot);
    EXPECT_TRUE(mask.empty());

    MatchResult result;
    HookMask candidates;
    EXPECT_EQ(matcher.match(make_event(1, 1, 2, 3), snapshot, result, candidates),
              Status::Unmatched);
    EXPECT_EQ(result.count, 0u);
}

TEST(PredicateMatcherTest, WildcardScreensThenConfirmsOnSubject) {
    std::vector<RegisteredHook> hooks;
    hooks.push_back(make_hook(10, TermPattern::exact(7)));
    hooks.push_back(make_hook(11, TermPattern::any(), TermPattern::exact(100)));
    hooks.push_back(make_hook(12, TermPattern::exact(8)));
    hooks.push_back(make_hook(13, TermPattern::exact(7), std::nullopt, TermPattern::exact(5)));
    hooks.push_back(make_hook(14, TermPattern::any()));
    HookSnapshot snapshot(3, std::move(hooks));

    for (MatcherBackend backend : {MatcherBackend::Scalar, MatcherBackend::Narrow, MatcherBackend::Wide}) {
        PredicateMatcher matcher(backend, true);
        Event event = make_event(42, 100, 7, 6);

        HookMask screened = matcher.match_predicate(event, snapshot);
        // 10, 11 (wildcard), 13, 14 (wildcard) pass the screen
        EXPECT_TRUE(screened.test(0));
        EXPECT_TRUE(screened.test(1));
        EXPECT_FALSE(screened.test(2));
        EXPECT_TRUE(screened.test(3));
        EXPECT_TRUE(screened.test(4));

        MatchResult result;
        HookMask candidates;
        ASSERT_EQ(matcher.match(event, snapshot, result, candidates), Status::Ok);
        EXPECT_EQ(result.event_id, 42u);
        EXPECT_EQ(result.epoch, 3u);
        ASSERT_EQ(result.count, 3u);
        // 13 fails its object pattern at confirm
        EXPECT_EQ(result.matched_hook_ids[0], 10u);
        EXPECT_EQ(result.matched_hook_ids[1], 11u);
        EXPECT_EQ(result.matched_hook_ids[2], 14u);
        EXPECT_EQ(result.matched_indices[2], 4u);
        EXPECT_EQ(candidates.popcount(), 4u);
    }
}

TEST(PredicateMatcherTest, SubjectMismatchIsUnmatched) {
    std::vector<RegisteredHook> hooks;
    hooks.push_back(make_hook(1, TermPattern::exact(7), TermPattern::exact(1)));
    HookSnapshot snapshot(1, std::move(hooks));

    PredicateMatcher matcher(MatcherBackend::Scalar);
    MatchResult result;
    HookMask candidates;
    EXPECT_EQ(matcher.match(make_event(1, 2, 7, 0), snapshot, result, candidates),
              Status::Unmatched);
    EXPECT_EQ(candidates.popcount(), 1u);
    EXPECT_EQ(result.count, 0u);
}

TEST(PredicateMatcherTest, MatchIsDeterministic) {
    std::vector<RegisteredHook> hooks;
    for (HookId id = 0; id < 40; ++id) {
        hooks.push_back(make_hook(id, id % 3 == 0 ? TermPattern::any() : TermPattern::exact(id % 4)));
    }
    HookSnapshot snapshot(1, std::move(hooks));
    PredicateMatcher matcher;

    MatchResult first;
    MatchResult second;
    HookMask c1;
    HookMask c2;
    Event event = make_event(9, 0, 2, 0);
    ASSERT_EQ(matcher.match(event, snapshot, first, c1), Status::Ok);
    ASSERT_EQ(matcher.match(event, snapshot, second, c2), Status::Ok);
    ASSERT_EQ(first.count, second.count);
    for (uint16_t i = 0; i < first.count; ++i) {
        EXPECT_EQ(first.matched_hook_ids[i], second.matched_hook_ids[i]);
    }
    EXPECT_EQ(c1, c2);
}

TEST(PredicateMatcherTest, SelfCheckReportsDisagreement) {
    std::vector<RegisteredHook> hooks;
    hooks.push_back(make_hook(1, TermPattern::exact(7)));
    hooks.push_back(make_hook(2, TermPattern::exact(9)));
    HookSnapshot snapshot(1, std::move(hooks));

    PredicateMatcher checked(MatcherBackend::Wide, &faulty_screen, true);
    MatchResult result;
    HookMask candidates;
    EXPECT_EQ(checked.match(make_event(1, 0, 7, 0), snapshot, result, candidates),
              Status::MatchAmbiguous);
    EXPECT_EQ(result.count, 0u);

    // Without the self-check the faulty screen goes unnoticed
    PredicateMatcher unchecked(MatcherBackend::Wide, &faulty_screen, false);
    EXPECT_EQ(unchecked.match(make_event(1, 0, 7, 0), snapshot, result, candidates),
              Status::Unmatched);
}

TEST(PredicateMatcherTest, FullHookSetUsesEveryMaskWord) {
    std::vector<RegisteredHook> hooks;
    for (HookId id = 0; id < MAX_HOOKS; ++id) {
        hooks.push_back(make_hook(id, TermPattern::exact(id % 64 == 63 ? 5 : 6)));
    }
    HookSnapshot snapshot(1, std::move(hooks));

    for (MatcherBackend backend : {MatcherBackend::Scalar, MatcherBackend::Narrow, MatcherBackend::Wide}) {
        HookMask mask = PredicateMatcher::match_predicate_with(backend, make_event(1, 0, 5, 0), snapshot);
        EXPECT_EQ(mask.popcount(), 4u) << matcher_backend_name(backend);
        EXPECT_TRUE(mask.test(63));
        EXPECT_TRUE(mask.test(255));
    }
}
