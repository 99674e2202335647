#include "mcpeasy/util/pagination.hpp"

#include <algorithm>

namespace mcpeasy::util::pagination
{

PageInfo PageTracker::begin(const std::string& cursor, int page_size)
{
    page_size = std::max(page_size, 0);

    auto& counter = counters_[cursor];
    if (cursor.empty())
    {
        // The first page is always page 1.
        counter.pages_before = 0;
    }
    else if (!counter.used && counter.pages_before == 0)
    {
        // A cursor we never handed out (e.g. from before a restart) follows at least one page.
        counter.pages_before = 1;
    }
    else if (counter.used)
    {
        ++counter.pages_before;
    }
    counter.used = true;

    PageInfo info;
    info.page = counter.pages_before + 1;
    info.start_index = counter.pages_before * page_size;
    return info;
}

void PageTracker::advance(const std::string& cursor, const std::string& next_cursor)
{
    if (next_cursor.empty())
        return;
    int before = 0;
    auto it = counters_.find(cursor);
    if (it != counters_.end())
        before = it->second.pages_before;
    counters_[next_cursor] = Counter{before + 1, false};
}

} // namespace mcpeasy::util::pagination
