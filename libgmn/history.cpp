/* history.c
 */
// This software is copyrighted as detailed in the LICENSE file.

#include "gmn/history.h"

void HistoryStack::push(const Url &url)
{
    m_entries.push_back(HistoryEntry{url.scheme, url.host, url.port, url.path});
}

bool HistoryStack::pop(HistoryEntry &entry)
{
    if (m_entries.empty())
    {
        return false;
    }
    entry = m_entries.back();
    m_entries.pop_back();
    return true;
}

// Pops the current entry and the one beneath it, handing back the latter.
// Navigating to it pushes it again, so one page back is shown and the
// stack ends up one shorter than before.
bool HistoryStack::back(HistoryEntry &previous)
{
    if (m_entries.size() < 2)
    {
        return false;
    }
    m_entries.pop_back();
    previous = m_entries.back();
    m_entries.pop_back();
    return true;
}

// Drops entries above depth; a shallower stack is left alone.
void HistoryStack::truncate(std::size_t depth)
{
    if (m_entries.size() > depth)
    {
        m_entries.resize(depth);
    }
}

Url entry_url(const HistoryEntry &entry)
{
    Url url;
    url.scheme = entry.scheme;
    url.host = entry.host;
    url.port = entry.port;
    url.path = entry.path;
    return url;
}
