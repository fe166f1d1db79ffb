#include "code_tables.hpp"

#include <linux/input-event-codes.h>

#include <unordered_map>

namespace code_tables {

namespace {

std::unordered_map<int, std::string> build_key_code_to_name() {
    std::unordered_map<int, std::string> key_code_to_name;

    key_code_to_name.emplace(KEY_ESC, "ESC");
    key_code_to_name.emplace(KEY_ENTER, "ENTER");
    key_code_to_name.emplace(KEY_BACKSPACE, "BACKSPACE");
    key_code_to_name.emplace(KEY_TAB, "TAB");
    key_code_to_name.emplace(KEY_SPACE, "SPACE");

    // letters
    key_code_to_name.emplace(KEY_Q, "Q");
    key_code_to_name.emplace(KEY_W, "W");
    key_code_to_name.emplace(KEY_E, "E");
    key_code_to_name.emplace(KEY_R, "R");
    key_code_to_name.emplace(KEY_T, "T");
    key_code_to_name.emplace(KEY_Y, "Y");
    key_code_to_name.emplace(KEY_U, "U");
    key_code_to_name.emplace(KEY_I, "I");
    key_code_to_name.emplace(KEY_O, "O");
    key_code_to_name.emplace(KEY_P, "P");
    key_code_to_name.emplace(KEY_A, "A");
    key_code_to_name.emplace(KEY_S, "S");
    key_code_to_name.emplace(KEY_D, "D");
    key_code_to_name.emplace(KEY_F, "F");
    key_code_to_name.emplace(KEY_G, "G");
    key_code_to_name.emplace(KEY_H, "H");
    key_code_to_name.emplace(KEY_J, "J");
    key_code_to_name.emplace(KEY_K, "K");
    key_code_to_name.emplace(KEY_L, "L");
    key_code_to_name.emplace(KEY_Z, "Z");
    key_code_to_name.emplace(KEY_X, "X");
    key_code_to_name.emplace(KEY_C, "C");
    key_code_to_name.emplace(KEY_V, "V");
    key_code_to_name.emplace(KEY_B, "B");
    key_code_to_name.emplace(KEY_N, "N");
    key_code_to_name.emplace(KEY_M, "M");

    // arrows
    key_code_to_name.emplace(KEY_UP, "UP");
    key_code_to_name.emplace(KEY_LEFT, "LEFT");
    key_code_to_name.emplace(KEY_RIGHT, "RIGHT");
    key_code_to_name.emplace(KEY_DOWN, "DOWN");

    // function keys
    key_code_to_name.emplace(KEY_F1, "F1");
    key_code_to_name.emplace(KEY_F2, "F2");
    key_code_to_name.emplace(KEY_F3, "F3");
    key_code_to_name.emplace(KEY_F4, "F4");
    key_code_to_name.emplace(KEY_F5, "F5");
    key_code_to_name.emplace(KEY_F6, "F6");
    key_code_to_name.emplace(KEY_F7, "F7");
    key_code_to_name.emplace(KEY_F8, "F8");
    key_code_to_name.emplace(KEY_F9, "F9");
    key_code_to_name.emplace(KEY_F10, "F10");
    key_code_to_name.emplace(KEY_F11, "F11");
    key_code_to_name.emplace(KEY_F12, "F12");

    // modifiers, only the left control key has an entry
    key_code_to_name.emplace(KEY_LEFTCTRL, "CTRL");
    key_code_to_name.emplace(KEY_LEFTSHIFT, "SHIFT (LEFT)");
    key_code_to_name.emplace(KEY_RIGHTSHIFT, "SHIFT (RIGHT)");
    key_code_to_name.emplace(KEY_LEFTALT, "ALT");
    key_code_to_name.emplace(KEY_RIGHTALT, "ALT GR");
    key_code_to_name.emplace(KEY_LEFTMETA, "SUPER/WIN");

    // number row and punctuation
    key_code_to_name.emplace(KEY_1, "1");
    key_code_to_name.emplace(KEY_2, "2");
    key_code_to_name.emplace(KEY_3, "3");
    key_code_to_name.emplace(KEY_4, "4");
    key_code_to_name.emplace(KEY_5, "5");
    key_code_to_name.emplace(KEY_6, "6");
    key_code_to_name.emplace(KEY_7, "7");
    key_code_to_name.emplace(KEY_8, "8");
    key_code_to_name.emplace(KEY_9, "9");
    key_code_to_name.emplace(KEY_0, "0");
    key_code_to_name.emplace(KEY_MINUS, "-");
    key_code_to_name.emplace(KEY_EQUAL, "=");
    key_code_to_name.emplace(KEY_LEFTBRACE, "[");
    key_code_to_name.emplace(KEY_RIGHTBRACE, "]");
    key_code_to_name.emplace(KEY_SEMICOLON, ";");
    key_code_to_name.emplace(KEY_APOSTROPHE, "'");
    key_code_to_name.emplace(KEY_GRAVE, "`");
    key_code_to_name.emplace(KEY_BACKSLASH, "\\");
    key_code_to_name.emplace(KEY_COMMA, ",");
    key_code_to_name.emplace(KEY_DOT, ".");
    key_code_to_name.emplace(KEY_SLASH, "/");
    key_code_to_name.emplace(KEY_CAPSLOCK, "CAPS LOCK");
    key_code_to_name.emplace(KEY_NUMLOCK, "NUM LOCK");
    key_code_to_name.emplace(KEY_SCROLLLOCK, "SCROLL LOCK");

    // numpad
    key_code_to_name.emplace(KEY_KP7, "NUM 7");
    key_code_to_name.emplace(KEY_KP8, "NUM 8");
    key_code_to_name.emplace(KEY_KP9, "NUM 9");
    key_code_to_name.emplace(KEY_KPMINUS, "NUM -");
    key_code_to_name.emplace(KEY_KP4, "NUM 4");
    key_code_to_name.emplace(KEY_KP5, "NUM 5");
    key_code_to_name.emplace(KEY_KP6, "NUM 6");
    key_code_to_name.emplace(KEY_KPPLUS, "NUM +");
    key_code_to_name.emplace(KEY_KP1, "NUM 1");
    key_code_to_name.emplace(KEY_KP2, "NUM 2");
    key_code_to_name.emplace(KEY_KP3, "NUM 3");
    key_code_to_name.emplace(KEY_KP0, "NUM 0");
    key_code_to_name.emplace(KEY_KPDOT, "NUM .");
    key_code_to_name.emplace(KEY_KPENTER, "NUM ENTER");
    key_code_to_name.emplace(KEY_KPSLASH, "NUM /");
    key_code_to_name.emplace(KEY_KPASTERISK, "NUM *");

    // media
    key_code_to_name.emplace(KEY_MUTE, "MUTE");
    key_code_to_name.emplace(KEY_VOLUMEDOWN, "VOLUME DOWN");
    key_code_to_name.emplace(KEY_VOLUMEUP, "VOLUME UP");

    // NOTE: the rest of the table keeps the names the monitor has always printed for these codes, several of them are
    // not the evdev meaning of the code (102 is KEY_HOME, 110 KEY_INSERT, 118 KEY_KPPLUSMINUS, 127 KEY_COMPOSE, 128-131
    // KEY_STOP..KEY_FRONT), and KEY_PAGEUP (104) has no entry at all
    key_code_to_name.emplace(KEY_SYSRQ, "PRINT SCREEN");
    key_code_to_name.emplace(KEY_PAUSE, "PAUSE");
    key_code_to_name.emplace(110, "HOME");
    key_code_to_name.emplace(102, "PAGE UP");
    key_code_to_name.emplace(KEY_END, "END");
    key_code_to_name.emplace(KEY_PAGEDOWN, "PAGE DOWN");
    key_code_to_name.emplace(KEY_DELETE, "DELETE");
    key_code_to_name.emplace(118, "INSERT");

    key_code_to_name.emplace(127, "PAUSE");
    key_code_to_name.emplace(128, "PREV TRACK");
    key_code_to_name.emplace(129, "NEXT TRACK");
    key_code_to_name.emplace(130, "STOP");
    key_code_to_name.emplace(131, "PLAY/PAUSE");

    return key_code_to_name;
}

std::unordered_map<int, std::string> build_button_code_to_name() {
    std::unordered_map<int, std::string> button_code_to_name;
    button_code_to_name.emplace(BTN_LEFT, "LEFT");
    button_code_to_name.emplace(BTN_RIGHT, "RIGHT");
    button_code_to_name.emplace(BTN_MIDDLE, "MIDDLE");
    button_code_to_name.emplace(BTN_SIDE, "SIDE");
    button_code_to_name.emplace(BTN_EXTRA, "EXTRA");
    return button_code_to_name;
}

} // namespace

std::string key_name(int key_code) {
    static const std::unordered_map<int, std::string> key_code_to_name = build_key_code_to_name();

    auto it = key_code_to_name.find(key_code);
    if (it == key_code_to_name.end())
        return unknown_key_name;
    return it->second;
}

std::string button_name(int button_code) {
    static const std::unordered_map<int, std::string> button_code_to_name = build_button_code_to_name();

    auto it = button_code_to_name.find(button_code);
    if (it == button_code_to_name.end())
        return std::to_string(button_code);
    return it->second;
}

} // namespace code_tables
