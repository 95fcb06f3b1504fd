#pragma once

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace colpick::model {

/// One selectable completion candidate.
struct Entry {
    std::string title;
    std::string description;

    bool operator==(const Entry& other) const = default;

    /// Text the column filter searches in.
    std::string filter_value() const { return title + "\n" + description; }
};

/// Named, ordered group of entries.
struct Category {
    std::string name;
    std::vector<Entry> entries;
};

/**
 * Read-only view of the candidates offered to the selector.
 *
 * Indices are 0-based and must stay consistent while Selector::set_values()
 * reads them. The selector copies everything it needs during that call and
 * never touches the source afterwards.
 */
class CandidateSource {
public:
    virtual ~CandidateSource() = default;

    virtual int num_categories() const = 0;
    virtual std::string category_title(int cat_idx) const = 0;
    virtual int num_entries(int cat_idx) const = 0;
    virtual Entry entry(int cat_idx, int entry_idx) const = 0;
};

/// In-memory candidate table.
class StaticCandidates : public CandidateSource {
public:
    StaticCandidates() = default;
    explicit StaticCandidates(std::vector<Category> categories);

    StaticCandidates& add_category(std::string name, std::vector<Entry> entries = {});
    void add_entry(Entry entry);  // Appends to the last category

    int num_categories() const override;
    std::string category_title(int cat_idx) const override;
    int num_entries(int cat_idx) const override;
    Entry entry(int cat_idx, int entry_idx) const override;

    int total_entries() const;
    const std::vector<Category>& categories() const { return categories_; }

private:
    std::vector<Category> categories_;
};

/// Category used for entries that appear before any "[Name]" header.
inline constexpr const char* DEFAULT_CATEGORY_NAME = "Candidates";

/**
 * Parse the candidate file format:
 *
 *   [Tables]
 *   users<TAB>registered accounts
 *   orders
 *
 * Blank lines and lines starting with '#' are skipped.
 */
StaticCandidates parse_candidates(std::istream& in);

/// Load a candidate file; std::nullopt if it cannot be opened.
std::optional<StaticCandidates> load_candidates(const std::filesystem::path& path);

}  // namespace colpick::model
