#include "xcode/scheme_resolver.hpp"
#include "core/orchestrator_state.hpp"
#include "process/process_runner.hpp"
#include "utils/debug_log.hpp"
#include "utils/json_extract.hpp"
#include "xcode/container_discovery.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>
#include <system_error>

namespace scheme_resolver {

namespace fs = std::filesystem;

static std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

static bool starts_with(const std::string &text, const std::string &prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

static bool ends_with(const std::string &text, const std::string &suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Splits "MyAppUITests v2" into {"my", "app", "ui", "tests", "v", "2"}.
static std::vector<std::string> split_words(const std::string &name) {
    std::vector<std::string> words;
    std::string current;

    auto flush = [&words, &current]() {
        if (!current.empty()) {
            words.push_back(to_lower(current));
            current.clear();
        }
    };

    for (size_t index = 0; index < name.size(); ++index) {
        unsigned char character = static_cast<unsigned char>(name[index]);
        if (!std::isalnum(character)) {
            flush();
            continue;
        }
        if (!current.empty()) {
            unsigned char previous = static_cast<unsigned char>(current.back());
            bool next_is_lower = index + 1 < name.size() &&
                                 std::islower(static_cast<unsigned char>(name[index + 1]));
            bool lower_to_upper = std::islower(previous) && std::isupper(character);
            // End of an acronym: "UITests" splits before the "T".
            bool acronym_end = std::isupper(previous) && std::isupper(character) && next_is_lower;
            bool digit_edge = (std::isdigit(previous) != 0) != (std::isdigit(character) != 0);
            if (lower_to_upper || acronym_end || digit_edge) {
                flush();
            }
        }
        current += static_cast<char>(character);
    }
    flush();
    return words;
}

bool is_test_scheme(const std::string &scheme) {
    for (const auto &word : split_words(scheme)) {
        if (word == "test" || word == "tests") {
            return true;
        }
    }
    return false;
}

bool looks_like_sample(const std::string &scheme) {
    std::string lowered = to_lower(scheme);
    return lowered.find("sample") != std::string::npos ||
           lowered.find("demo") != std::string::npos ||
           lowered.find("example") != std::string::npos;
}

int score_scheme(const std::string &scheme,
                 const std::vector<std::string> &hints,
                 const SchemeScoreWeights &weights) {
    std::string normalized_scheme = container_discovery::normalize_name(scheme);

    int hint_score = 0;
    if (!normalized_scheme.empty()) {
        for (const auto &hint : hints) {
            std::string normalized_hint = container_discovery::normalize_name(hint);
            if (normalized_hint.empty()) {
                continue;
            }
            int contribution = 0;
            if (normalized_scheme == normalized_hint) {
                contribution = weights.exact_match;
            } else if (starts_with(normalized_hint, normalized_scheme)) {
                contribution = weights.scheme_prefix_of_hint;
            } else if (starts_with(normalized_scheme, normalized_hint)) {
                contribution = weights.hint_prefix_of_scheme;
            }
            hint_score = std::max(hint_score, contribution);
        }
    }

    int score = hint_score;
    if (to_lower(scheme).find("app") != std::string::npos) {
        score += weights.app_bonus;
    }
    if (looks_like_sample(scheme)) {
        score -= weights.sample_penalty;
    }
    if (is_test_scheme(scheme)) {
        score -= weights.test_penalty;
    }
    return score;
}

std::vector<ScoredScheme> rank_schemes(const std::vector<std::string> &schemes,
                                       const std::vector<std::string> &hints,
                                       const SchemeScoreWeights &weights) {
    std::vector<ScoredScheme> ranked;
    for (const auto &scheme : schemes) {
        ranked.push_back({scheme, score_scheme(scheme, hints, weights)});
    }
    std::sort(ranked.begin(), ranked.end(), [](const ScoredScheme &left, const ScoredScheme &right) {
        if (left.score != right.score) {
            return left.score > right.score;
        }
        return left.name < right.name;
    });
    return ranked;
}

std::string choose_from_ranking(const std::vector<ScoredScheme> &ranked,
                                const DefaultSelectionThresholds &thresholds) {
    if (ranked.empty()) {
        return "";
    }
    const ScoredScheme &top = ranked[0];
    if (top.score < thresholds.minimum_score) {
        return "";
    }
    if (ranked.size() > 1 && top.score - ranked[1].score < thresholds.minimum_lead) {
        return "";
    }
    return top.name;
}

std::string pick_default_scheme(const std::vector<std::string> &schemes,
                                const std::vector<std::string> &hints,
                                const SchemeScoreWeights &weights,
                                const DefaultSelectionThresholds &thresholds) {
    if (schemes.size() == 1) {
        return schemes[0];
    }

    std::vector<std::string> app_schemes;
    for (const auto &scheme : schemes) {
        if (!is_test_scheme(scheme)) {
            app_schemes.push_back(scheme);
        }
    }
    if (app_schemes.size() == 1) {
        return app_schemes[0];
    }

    return choose_from_ranking(rank_schemes(schemes, hints, weights), thresholds);
}

std::string pick_first_app_scheme(const std::vector<std::string> &schemes) {
    for (const auto &scheme : schemes) {
        if (!is_test_scheme(scheme)) {
            return scheme;
        }
    }
    return schemes.empty() ? "" : schemes[0];
}

static std::string payload_name(const json &list_payload, const char *section) {
    if (!list_payload.is_object()) {
        return "";
    }
    auto found = list_payload.find(section);
    if (found == list_payload.end() || !found->is_object()) {
        return "";
    }
    auto name = found->find("name");
    if (name == found->end() || !name->is_string()) {
        return "";
    }
    return name->get<std::string>();
}

std::vector<std::string> collect_hints(const json &list_payload,
                                       const xcode_types::Container &container,
                                       const std::string &root_path) {
    std::vector<std::string> hints;
    auto add = [&hints](const std::string &hint) {
        if (!hint.empty()) {
            hints.push_back(hint);
        }
    };
    add(payload_name(list_payload, "workspace"));
    add(payload_name(list_payload, "project"));
    add(container_discovery::strip_container_suffix(fs::path(container.path).filename().string()));

    fs::path root(root_path);
    if (!root.has_filename()) {
        root = root.parent_path();
    }
    add(root.filename().string());
    return hints;
}

// Collects <directory>/*.xcscheme names into schemes. Missing directories are fine.
static void collect_scheme_files(const fs::path &directory, std::set<std::string> &schemes) {
    std::error_code error;
    fs::directory_iterator iterator(directory, error);
    if (error) {
        return;
    }
    for (; iterator != fs::directory_iterator(); iterator.increment(error)) {
        if (error) {
            break;
        }
        std::error_code status_error;
        if (iterator->is_directory(status_error)) {
            continue;
        }
        std::string name = iterator->path().filename().string();
        if (ends_with(name, SCHEME_FILE_SUFFIX)) {
            schemes.insert(name.substr(0, name.size() - std::string(SCHEME_FILE_SUFFIX).size()));
        }
    }
}

std::vector<std::string> read_schemes_from_filesystem(const xcode_types::Container &container) {
    std::set<std::string> schemes;
    fs::path base(container.path);

    collect_scheme_files(base / "xcshareddata" / "xcschemes", schemes);

    std::error_code error;
    fs::directory_iterator users(base / "xcuserdata", error);
    if (!error) {
        for (; users != fs::directory_iterator(); users.increment(error)) {
            if (error) {
                break;
            }
            std::error_code status_error;
            if (users->is_directory(status_error)) {
                collect_scheme_files(users->path() / "xcschemes", schemes);
            }
        }
    }

    // std::set is already ordered.
    return std::vector<std::string>(schemes.begin(), schemes.end());
}

static std::vector<std::string> string_array(const json &list_payload, const char *section) {
    std::vector<std::string> values;
    if (!list_payload.is_object()) {
        return values;
    }
    auto found = list_payload.find(section);
    if (found == list_payload.end() || !found->is_object()) {
        return values;
    }
    auto schemes = found->find("schemes");
    if (schemes == found->end() || !schemes->is_array()) {
        return values;
    }
    for (const auto &entry : *schemes) {
        if (entry.is_string()) {
            values.push_back(entry.get<std::string>());
        }
    }
    return values;
}

std::vector<std::string> schemes_from_payload(const json &list_payload) {
    std::vector<std::string> schemes = string_array(list_payload, "workspace");
    if (schemes.empty()) {
        schemes = string_array(list_payload, "project");
    }
    return schemes;
}

xcode_types::SchemeListResult list_schemes(orchestrator_state::OrchestratorState &state, const std::string &root_path) {
    std::optional<xcode_types::Container> container = container_discovery::find_container(state, root_path);
    if (!container) {
        xcode_types::SchemeListResult result;
        result.stage = "container";
        result.error_message = "No Xcode workspace or project found.";
        return result;
    }
    return list_schemes(state, root_path, *container);
}

xcode_types::SchemeListResult list_schemes(orchestrator_state::OrchestratorState &state,
                                           const std::string &root_path,
                                           const xcode_types::Container &container) {
    std::string cache_key = std::string(xcode_types::container_type_name(container.type)) + ":" + container.path;

    xcode_types::SchemeListResult result;
    if (state.scheme_cache.lookup(cache_key, result)) {
        debug_log::log("schemes for " + cache_key + " served from cache");
        return result;
    }

    // Remember which container this root resolved to, even when the caller supplied it.
    std::optional<xcode_types::Container> cached_container;
    if (!state.container_cache.lookup(root_path, cached_container) || !cached_container ||
        cached_container->path != container.path) {
        state.container_cache.store(root_path, container);
    }

    result.container = container;

    std::vector<std::string> file_schemes = read_schemes_from_filesystem(container);
    if (!file_schemes.empty()) {
        result.success = true;
        result.schemes = file_schemes;
        result.default_scheme = pick_first_app_scheme(file_schemes);
        state.scheme_cache.store(cache_key, result);
        return result;
    }

    process_runner::RunOptions options;
    options.working_directory = root_path;
    options.timeout_milliseconds = LIST_TIMEOUT_MILLISECONDS;
    process_runner::CommandResult list_result = process_runner::run(
        state.config().xcodebuild_path,
        {"-list", "-json", xcode_types::container_flag(container.type), container.path},
        options);

    if (!list_result.success) {
        result.stage = "schemes";
        result.error_message = process_runner::failure_text(list_result, "Failed to list Xcode schemes.");
        result.details.stdout_text = list_result.stdout_text;
        result.details.stderr_text = list_result.stderr_text;
        return result;
    }

    json payload = json_extract::extract_object(list_result.stdout_text, list_result.stderr_text);
    if (payload.is_null()) {
        result.stage = "schemes";
        result.error_message = "Unable to parse Xcode schemes.";
        return result;
    }

    std::vector<std::string> schemes = schemes_from_payload(payload);
    std::sort(schemes.begin(), schemes.end());
    if (schemes.empty()) {
        result.stage = "schemes";
        result.error_message = "No schemes found for this project.";
        return result;
    }

    result.success = true;
    result.schemes = schemes;
    result.list_payload = payload;
    result.default_scheme = pick_default_scheme(schemes, collect_hints(payload, container, root_path));
    debug_log::log("xcodebuild listed " + std::to_string(schemes.size()) + " scheme(s), default '" +
                   result.default_scheme + "'");
    state.scheme_cache.store(cache_key, result);
    return result;
}

} // namespace scheme_resolver
