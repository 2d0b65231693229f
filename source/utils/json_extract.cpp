#include "utils/json_extract.hpp"

#include <vector>

namespace json_extract {

json extract_object(const std::string &stdout_text, const std::string &stderr_text) {
    std::string combined = stdout_text;
    if (!stdout_text.empty() && !stderr_text.empty()) {
        combined += "\n";
    }
    combined += stderr_text;

    const std::vector<const std::string *> candidates = {&stdout_text, &stderr_text, &combined};
    for (const std::string *candidate : candidates) {
        if (candidate->empty()) {
            continue;
        }
        size_t start = candidate->find('{');
        size_t end = candidate->rfind('}');
        if (start == std::string::npos || end == std::string::npos || end <= start) {
            continue;
        }
        // parse without exceptions: a discarded value means "try the next candidate".
        json parsed = json::parse(candidate->begin() + static_cast<std::ptrdiff_t>(start),
                                  candidate->begin() + static_cast<std::ptrdiff_t>(end) + 1,
                                  nullptr, false);
        if (!parsed.is_discarded()) {
            return parsed;
        }
    }
    return json();
}

} // namespace json_extract
