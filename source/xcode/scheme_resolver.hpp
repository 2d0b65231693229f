#ifndef SIMPILOT_SCHEME_RESOLVER_HPP
#define SIMPILOT_SCHEME_RESOLVER_HPP

// Scheme enumeration for a container and the default-scheme heuristics.
//
// Scheme files on disk are authoritative when present; otherwise
// `xcodebuild -list -json` is asked. Only the xcodebuild listing feeds the
// hint-scoring heuristic, since only it carries workspace/project names.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "xcode/xcode_types.hpp"

namespace orchestrator_state {
class OrchestratorState;
}

namespace scheme_resolver {

using json = nlohmann::json;

static const char SCHEME_FILE_SUFFIX[] = ".xcscheme";
constexpr int LIST_TIMEOUT_MILLISECONDS = 10000;

struct SchemeScoreWeights {
    int exact_match = 120;
    int scheme_prefix_of_hint = 20;
    int hint_prefix_of_scheme = 40;
    int app_bonus = 10;
    int sample_penalty = 25;
    int test_penalty = 200;
};

struct DefaultSelectionThresholds {
    int minimum_score = 80;
    int minimum_lead = 15;
};

struct ScoredScheme {
    std::string name;
    int score = 0;
};

// "test"/"tests" as a whole word, CamelCase boundaries included
// ("MyAppTests", "MyAppUITests", "Unit Tests"); case-insensitive.
bool is_test_scheme(const std::string &scheme);

// Contains "sample", "demo" or "example" (case-insensitive).
bool looks_like_sample(const std::string &scheme);

// Best single-hint contribution plus the generic bonuses and penalties.
int score_scheme(const std::string &scheme,
                 const std::vector<std::string> &hints,
                 const SchemeScoreWeights &weights = {});

// Score descending, then name ascending.
std::vector<ScoredScheme> rank_schemes(const std::vector<std::string> &schemes,
                                       const std::vector<std::string> &hints,
                                       const SchemeScoreWeights &weights = {});

// Top entry if it clears the minimum score and leads the runner-up by the
// minimum lead; empty string when ambiguous.
std::string choose_from_ranking(const std::vector<ScoredScheme> &ranked,
                                const DefaultSelectionThresholds &thresholds = {});

// Heuristic pick: the only scheme, else the only non-test scheme, else ranking.
std::string pick_default_scheme(const std::vector<std::string> &schemes,
                                const std::vector<std::string> &hints,
                                const SchemeScoreWeights &weights = {},
                                const DefaultSelectionThresholds &thresholds = {});

// Pick used when scheme files were authoritative: first non-test, else first.
std::string pick_first_app_scheme(const std::vector<std::string> &schemes);

// Hints: payload workspace name, payload project name, container basename
// without suffix, root directory basename.
std::vector<std::string> collect_hints(const json &list_payload,
                                       const xcode_types::Container &container,
                                       const std::string &root_path);

// Shared and per-user .xcscheme files, de-duplicated and sorted.
std::vector<std::string> read_schemes_from_filesystem(const xcode_types::Container &container);

// workspace.schemes if non-empty, else project.schemes.
std::vector<std::string> schemes_from_payload(const json &list_payload);

// Resolve the container (cached) and list its schemes.
xcode_types::SchemeListResult list_schemes(orchestrator_state::OrchestratorState &state, const std::string &root_path);

// List schemes of an already known container (cached per container).
xcode_types::SchemeListResult list_schemes(orchestrator_state::OrchestratorState &state,
                                           const std::string &root_path,
                                           const xcode_types::Container &container);

} // namespace scheme_resolver

#endif // SIMPILOT_SCHEME_RESOLVER_HPP
