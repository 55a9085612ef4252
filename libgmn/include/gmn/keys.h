/* gmn/keys.h
 */
// This software is copyrighted as detailed in the LICENSE file.
#ifndef GMN_KEYS_H
#define GMN_KEYS_H

#include "gmn/opt.h"
#include "gmn/terminal.h"

#include <map>

enum InputEventKind
{
    IE_END = 0,        // no more input
    IE_PLAIN_KEY,      // one ordinary byte
    IE_ESCAPE_SEQUENCE // ESC followed by two bytes
};

struct InputEvent
{
    InputEventKind kind;
    char           key;
    char           sequence[2];
};

using KeyMap = std::map<char, PagerCommand>;

InputEvent read_input_event(ITerminal &terminal);
int        scroll_delta(const InputEvent &event);
KeyMap     build_keymap(const Config &config);

inline PagerCommand lookup_command(const KeyMap &keymap, char key)
{
    const auto it = keymap.find(key);
    return it == keymap.end() ? CMD_NONE : it->second;
}

#endif
