//
// Analysis result printing and name suggestions
//

#include <gdl/semantic.hh>
#include <algorithm>
#include <ostream>

namespace gdl::semantic {

// ============================================================================
// Analysis Result Methods
// ============================================================================

void analysis_result::print_diagnostics(std::ostream& os, const std::string& file) const {
    for (const auto& diag : errors) {
        os << diag.format(file);
    }
    for (const auto& diag : warnings) {
        os << diag.format(file);
    }

    // Summary
    if (!errors.empty() || !warnings.empty()) {
        os << "\n";
        if (!errors.empty()) {
            os << errors.size() << " error" << (errors.size() != 1 ? "s" : "");
        }
        if (!warnings.empty()) {
            if (!errors.empty()) os << ", ";
            os << warnings.size() << " warning" << (warnings.size() != 1 ? "s" : "");
        }
        os << " generated.\n";
    }
}

// ============================================================================
// Suggestions
// ============================================================================

std::size_t edit_distance(std::string_view a, std::string_view b) {
    const std::size_t m = a.size();
    const std::size_t n = b.size();
    std::vector<std::size_t> prev(n + 1), cur(n + 1);
    for (std::size_t j = 0; j <= n; ++j) {
        prev[j] = j;
    }
    for (std::size_t i = 1; i <= m; ++i) {
        cur[0] = i;
        for (std::size_t j = 1; j <= n; ++j) {
            const std::size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, cur);
    }
    return prev[n];
}

std::vector<std::string> similar_names(std::string_view name,
                                       const std::vector<std::string>& candidates) {
    constexpr std::size_t max_distance = 2;

    std::vector<std::pair<std::size_t, std::string>> scored;
    for (const auto& candidate : candidates) {
        const auto d = edit_distance(name, candidate);
        if (d <= max_distance) {
            scored.emplace_back(d, candidate);
        }
    }
    // closest first, ties by name
    std::sort(scored.begin(), scored.end());

    std::vector<std::string> result;
    result.reserve(scored.size());
    for (auto& [d, candidate] : scored) {
        result.push_back(std::move(candidate));
    }
    return result;
}

} // namespace gdl::semantic
