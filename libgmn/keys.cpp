/* keys.c
 */
// This software is copyrighted as detailed in the LICENSE file.

#include "gmn/keys.h"

enum
{
    ESC = '\033'
};

InputEvent read_input_event(ITerminal &terminal)
{
    InputEvent event{IE_END, '\0', {'\0', '\0'}};

    const int ch = terminal.read_byte();
    if (ch < 0)
    {
        return event;
    }
    event.key = static_cast<char>(ch);
    if (ch != ESC)
    {
        event.kind = IE_PLAIN_KEY;
        return event;
    }

    for (char &c : event.sequence)
    {
        const int next = terminal.read_byte();
        if (next < 0)
        {
            return event;
        }
        c = static_cast<char>(next);
    }
    event.kind = IE_ESCAPE_SEQUENCE;
    return event;
}

// Arrow up and down, in both normal (ESC [) and application (ESC O) modes.
int scroll_delta(const InputEvent &event)
{
    if (event.kind != IE_ESCAPE_SEQUENCE || (event.sequence[0] != '[' && event.sequence[0] != 'O'))
    {
        return 0;
    }
    switch (event.sequence[1])
    {
    case 'A':
        return -1;
    case 'B':
        return 1;
    default:
        return 0;
    }
}

KeyMap build_keymap(const Config &config)
{
    KeyMap keymap;
    for (int cmd = CMD_QUIT; cmd < CMD_COUNT; cmd++)
    {
        if (config.keys[cmd])
        {
            keymap.emplace(config.keys[cmd], static_cast<PagerCommand>(cmd));
        }
    }
    return keymap;
}
