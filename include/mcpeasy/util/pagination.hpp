#pragma once
#include <string>
#include <unordered_map>

namespace mcpeasy::util::pagination
{

/// Display position of one page of a cursor-paginated upstream listing.
struct PageInfo
{
    int page{1};        ///< 1-based page number
    int start_index{0}; ///< 0-based index of the first item, page_size * (page - 1)

    /// 1-based number of the first item shown.
    int first_item() const
    {
        return start_index + 1;
    }
    /// 1-based number of the last item shown, for a page holding `count` items.
    int last_item(int count) const
    {
        return start_index + count;
    }
};

/**
 * Reconstructs human-readable page numbers for opaque upstream cursors.
 *
 * Keyed by the cursor that fetched a page (empty key = first page). The
 * counter stored for a key is the number of pages preceding the page that
 * cursor fetches; multiplying it by the page size gives the starting index.
 * Cursors handed back to the client are seeded with the following page's
 * count by advance(). Re-using a key increments its counter.
 *
 * Display only: the upstream cursor token, never this counter, is what gets
 * sent upstream. Session-local and never persisted.
 */
class PageTracker
{
  public:
    /// Position of the page fetched with `cursor` (empty for the first page).
    PageInfo begin(const std::string& cursor, int page_size);

    /// Record that the page fetched with `cursor` handed out `next_cursor`.
    void advance(const std::string& cursor, const std::string& next_cursor);

    size_t tracked_keys() const
    {
        return counters_.size();
    }

  private:
    struct Counter
    {
        int pages_before{0};
        bool used{false};
    };

    std::unordered_map<std::string, Counter> counters_;
};

} // namespace mcpeasy::util::pagination
