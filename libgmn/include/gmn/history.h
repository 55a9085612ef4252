/* gmn/history.h
 */
// This software is copyrighted as detailed in the LICENSE file.
#ifndef GMN_HISTORY_H
#define GMN_HISTORY_H

#include "gmn/url.h"

#include <cstddef>
#include <string>
#include <vector>

// The query is not part of a history entry.
struct HistoryEntry
{
    std::string scheme;
    std::string host;
    int         port;
    std::string path;
};

// Every fetch pushes its target before the outcome is known, so the top
// entry is always the most recent attempt.
class HistoryStack
{
public:
    void push(const Url &url);
    bool pop(HistoryEntry &entry);
    bool back(HistoryEntry &previous);
    void truncate(std::size_t depth);

    std::size_t depth() const
    {
        return m_entries.size();
    }
    bool empty() const
    {
        return m_entries.empty();
    }
    const HistoryEntry &top() const
    {
        return m_entries.back();
    }

private:
    std::vector<HistoryEntry> m_entries;
};

Url entry_url(const HistoryEntry &entry);

#endif
