#include "model/Candidates.hpp"
#include "util/Logger.hpp"
#include <fstream>
#include <stdexcept>

namespace colpick::model {

StaticCandidates::StaticCandidates(std::vector<Category> categories)
    : categories_(std::move(categories)) {}

StaticCandidates& StaticCandidates::add_category(std::string name, std::vector<Entry> entries) {
    categories_.push_back(Category{std::move(name), std::move(entries)});
    return *this;
}

void StaticCandidates::add_entry(Entry entry) {
    if (categories_.empty()) {
        add_category(DEFAULT_CATEGORY_NAME);
    }
    categories_.back().entries.push_back(std::move(entry));
}

int StaticCandidates::num_categories() const {
    return static_cast<int>(categories_.size());
}

std::string StaticCandidates::category_title(int cat_idx) const {
    return categories_.at(cat_idx).name;
}

int StaticCandidates::num_entries(int cat_idx) const {
    return static_cast<int>(categories_.at(cat_idx).entries.size());
}

Entry StaticCandidates::entry(int cat_idx, int entry_idx) const {
    return categories_.at(cat_idx).entries.at(entry_idx);
}

int StaticCandidates::total_entries() const {
    int total = 0;
    for (const auto& cat : categories_) {
        total += static_cast<int>(cat.entries.size());
    }
    return total;
}

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

StaticCandidates parse_candidates(std::istream& in) {
    StaticCandidates result;
    std::string line;
    int line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();

        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;

        // Category header
        if (trimmed.front() == '[' && trimmed.back() == ']') {
            result.add_category(trim(trimmed.substr(1, trimmed.length() - 2)));
            continue;
        }

        // title<TAB>description
        Entry entry;
        auto tab = line.find('\t');
        if (tab == std::string::npos) {
            entry.title = trimmed;
        } else {
            entry.title = trim(line.substr(0, tab));
            entry.description = trim(line.substr(tab + 1));
        }

        if (entry.title.empty()) {
            util::Logger::warn("Candidates: line " + std::to_string(line_no) + " has no title, skipped");
            continue;
        }
        result.add_entry(std::move(entry));
    }

    return result;
}

std::optional<StaticCandidates> load_candidates(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        util::Logger::error("Candidates: cannot open " + path.string());
        return std::nullopt;
    }

    auto candidates = parse_candidates(file);
    util::Logger::info("Candidates: loaded " + std::to_string(candidates.num_categories()) +
                       " categories, " + std::to_string(candidates.total_entries()) +
                       " entries from " + path.string());
    return candidates;
}

}  // namespace colpick::model
