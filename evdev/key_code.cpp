#include "key_code.hpp"

#include <cctype>
#include <limits>

namespace Evdev {

namespace {

struct KeyName {
    const char* name;
    std::uint16_t code;
};

#define KEY_ENTRY(k) KeyName{ #k, k }

// Every KEY_* / BTN_* code of <linux/input-event-codes.h>, in header order.
// Aliases (BTN_A / BTN_SOUTH, KEY_HANGUEL / KEY_HANGEUL, ...) share a code;
// name() reports whichever comes first.
constexpr KeyName kKeyNames[] = {
    KEY_ENTRY(KEY_ESC), KEY_ENTRY(KEY_1), KEY_ENTRY(KEY_2),
    KEY_ENTRY(KEY_3), KEY_ENTRY(KEY_4), KEY_ENTRY(KEY_5),
    KEY_ENTRY(KEY_6), KEY_ENTRY(KEY_7), KEY_ENTRY(KEY_8),
    KEY_ENTRY(KEY_9), KEY_ENTRY(KEY_0), KEY_ENTRY(KEY_MINUS),
    KEY_ENTRY(KEY_EQUAL), KEY_ENTRY(KEY_BACKSPACE), KEY_ENTRY(KEY_TAB),
    KEY_ENTRY(KEY_Q), KEY_ENTRY(KEY_W), KEY_ENTRY(KEY_E),
    KEY_ENTRY(KEY_R), KEY_ENTRY(KEY_T), KEY_ENTRY(KEY_Y),
    KEY_ENTRY(KEY_U), KEY_ENTRY(KEY_I), KEY_ENTRY(KEY_O),
    KEY_ENTRY(KEY_P), KEY_ENTRY(KEY_LEFTBRACE), KEY_ENTRY(KEY_RIGHTBRACE),
    KEY_ENTRY(KEY_ENTER), KEY_ENTRY(KEY_LEFTCTRL), KEY_ENTRY(KEY_A),
    KEY_ENTRY(KEY_S), KEY_ENTRY(KEY_D), KEY_ENTRY(KEY_F),
    KEY_ENTRY(KEY_G), KEY_ENTRY(KEY_H), KEY_ENTRY(KEY_J),
    KEY_ENTRY(KEY_K), KEY_ENTRY(KEY_L), KEY_ENTRY(KEY_SEMICOLON),
    KEY_ENTRY(KEY_APOSTROPHE), KEY_ENTRY(KEY_GRAVE), KEY_ENTRY(KEY_LEFTSHIFT),
    KEY_ENTRY(KEY_BACKSLASH), KEY_ENTRY(KEY_Z), KEY_ENTRY(KEY_X),
    KEY_ENTRY(KEY_C), KEY_ENTRY(KEY_V), KEY_ENTRY(KEY_B),
    KEY_ENTRY(KEY_N), KEY_ENTRY(KEY_M), KEY_ENTRY(KEY_COMMA),
    KEY_ENTRY(KEY_DOT), KEY_ENTRY(KEY_SLASH), KEY_ENTRY(KEY_RIGHTSHIFT),
    KEY_ENTRY(KEY_KPASTERISK), KEY_ENTRY(KEY_LEFTALT), KEY_ENTRY(KEY_SPACE),
    KEY_ENTRY(KEY_CAPSLOCK), KEY_ENTRY(KEY_F1), KEY_ENTRY(KEY_F2),
    KEY_ENTRY(KEY_F3), KEY_ENTRY(KEY_F4), KEY_ENTRY(KEY_F5),
    KEY_ENTRY(KEY_F6), KEY_ENTRY(KEY_F7), KEY_ENTRY(KEY_F8),
    KEY_ENTRY(KEY_F9), KEY_ENTRY(KEY_F10), KEY_ENTRY(KEY_NUMLOCK),
    KEY_ENTRY(KEY_SCROLLLOCK), KEY_ENTRY(KEY_KP7), KEY_ENTRY(KEY_KP8),
    KEY_ENTRY(KEY_KP9), KEY_ENTRY(KEY_KPMINUS), KEY_ENTRY(KEY_KP4),
    KEY_ENTRY(KEY_KP5), KEY_ENTRY(KEY_KP6), KEY_ENTRY(KEY_KPPLUS),
    KEY_ENTRY(KEY_KP1), KEY_ENTRY(KEY_KP2), KEY_ENTRY(KEY_KP3),
    KEY_ENTRY(KEY_KP0), KEY_ENTRY(KEY_KPDOT), KEY_ENTRY(KEY_ZENKAKUHANKAKU),
    KEY_ENTRY(KEY_102ND), KEY_ENTRY(KEY_F11), KEY_ENTRY(KEY_F12),
    KEY_ENTRY(KEY_RO), KEY_ENTRY(KEY_KATAKANA), KEY_ENTRY(KEY_HIRAGANA),
    KEY_ENTRY(KEY_HENKAN), KEY_ENTRY(KEY_KATAKANAHIRAGANA), KEY_ENTRY(KEY_MUHENKAN),
    KEY_ENTRY(KEY_KPJPCOMMA), KEY_ENTRY(KEY_KPENTER), KEY_ENTRY(KEY_RIGHTCTRL),
    KEY_ENTRY(KEY_KPSLASH), KEY_ENTRY(KEY_SYSRQ), KEY_ENTRY(KEY_RIGHTALT),
    KEY_ENTRY(KEY_LINEFEED), KEY_ENTRY(KEY_HOME), KEY_ENTRY(KEY_UP),
    KEY_ENTRY(KEY_PAGEUP), KEY_ENTRY(KEY_LEFT), KEY_ENTRY(KEY_RIGHT),
    KEY_ENTRY(KEY_END), KEY_ENTRY(KEY_DOWN), KEY_ENTRY(KEY_PAGEDOWN),
    KEY_ENTRY(KEY_INSERT), KEY_ENTRY(KEY_DELETE), KEY_ENTRY(KEY_MACRO),
    KEY_ENTRY(KEY_MUTE), KEY_ENTRY(KEY_VOLUMEDOWN), KEY_ENTRY(KEY_VOLUMEUP),
    KEY_ENTRY(KEY_POWER), KEY_ENTRY(KEY_KPEQUAL), KEY_ENTRY(KEY_KPPLUSMINUS),
    KEY_ENTRY(KEY_PAUSE), KEY_ENTRY(KEY_SCALE), KEY_ENTRY(KEY_KPCOMMA),
    KEY_ENTRY(KEY_HANGEUL), KEY_ENTRY(KEY_HANGUEL), KEY_ENTRY(KEY_HANJA),
    KEY_ENTRY(KEY_YEN), KEY_ENTRY(KEY_LEFTMETA), KEY_ENTRY(KEY_RIGHTMETA),
    KEY_ENTRY(KEY_COMPOSE), KEY_ENTRY(KEY_STOP), KEY_ENTRY(KEY_AGAIN),
    KEY_ENTRY(KEY_PROPS), KEY_ENTRY(KEY_UNDO), KEY_ENTRY(KEY_FRONT),
    KEY_ENTRY(KEY_COPY), KEY_ENTRY(KEY_OPEN), KEY_ENTRY(KEY_PASTE),
    KEY_ENTRY(KEY_FIND), KEY_ENTRY(KEY_CUT), KEY_ENTRY(KEY_HELP),
    KEY_ENTRY(KEY_MENU), KEY_ENTRY(KEY_CALC), KEY_ENTRY(KEY_SETUP),
    KEY_ENTRY(KEY_SLEEP), KEY_ENTRY(KEY_WAKEUP), KEY_ENTRY(KEY_FILE),
    KEY_ENTRY(KEY_SENDFILE), KEY_ENTRY(KEY_DELETEFILE), KEY_ENTRY(KEY_XFER),
    KEY_ENTRY(KEY_PROG1), KEY_ENTRY(KEY_PROG2), KEY_ENTRY(KEY_WWW),
    KEY_ENTRY(KEY_MSDOS), KEY_ENTRY(KEY_COFFEE), KEY_ENTRY(KEY_SCREENLOCK),
    KEY_ENTRY(KEY_ROTATE_DISPLAY), KEY_ENTRY(KEY_DIRECTION), KEY_ENTRY(KEY_CYCLEWINDOWS),
    KEY_ENTRY(KEY_MAIL), KEY_ENTRY(KEY_BOOKMARKS), KEY_ENTRY(KEY_COMPUTER),
    KEY_ENTRY(KEY_BACK), KEY_ENTRY(KEY_FORWARD), KEY_ENTRY(KEY_CLOSECD),
    KEY_ENTRY(KEY_EJECTCD), KEY_ENTRY(KEY_EJECTCLOSECD), KEY_ENTRY(KEY_NEXTSONG),
    KEY_ENTRY(KEY_PLAYPAUSE), KEY_ENTRY(KEY_PREVIOUSSONG), KEY_ENTRY(KEY_STOPCD),
    KEY_ENTRY(KEY_RECORD), KEY_ENTRY(KEY_REWIND), KEY_ENTRY(KEY_PHONE),
    KEY_ENTRY(KEY_ISO), KEY_ENTRY(KEY_CONFIG), KEY_ENTRY(KEY_HOMEPAGE),
    KEY_ENTRY(KEY_REFRESH), KEY_ENTRY(KEY_EXIT), KEY_ENTRY(KEY_MOVE),
    KEY_ENTRY(KEY_EDIT), KEY_ENTRY(KEY_SCROLLUP), KEY_ENTRY(KEY_SCROLLDOWN),
    KEY_ENTRY(KEY_KPLEFTPAREN), KEY_ENTRY(KEY_KPRIGHTPAREN), KEY_ENTRY(KEY_NEW),
    KEY_ENTRY(KEY_REDO), KEY_ENTRY(KEY_F13), KEY_ENTRY(KEY_F14),
    KEY_ENTRY(KEY_F15), KEY_ENTRY(KEY_F16), KEY_ENTRY(KEY_F17),
    KEY_ENTRY(KEY_F18), KEY_ENTRY(KEY_F19), KEY_ENTRY(KEY_F20),
    KEY_ENTRY(KEY_F21), KEY_ENTRY(KEY_F22), KEY_ENTRY(KEY_F23),
    KEY_ENTRY(KEY_F24), KEY_ENTRY(KEY_PLAYCD), KEY_ENTRY(KEY_PAUSECD),
    KEY_ENTRY(KEY_PROG3), KEY_ENTRY(KEY_PROG4), KEY_ENTRY(KEY_ALL_APPLICATIONS),
    KEY_ENTRY(KEY_DASHBOARD), KEY_ENTRY(KEY_SUSPEND), KEY_ENTRY(KEY_CLOSE),
    KEY_ENTRY(KEY_PLAY), KEY_ENTRY(KEY_FASTFORWARD), KEY_ENTRY(KEY_BASSBOOST),
    KEY_ENTRY(KEY_PRINT), KEY_ENTRY(KEY_HP), KEY_ENTRY(KEY_CAMERA),
    KEY_ENTRY(KEY_SOUND), KEY_ENTRY(KEY_QUESTION), KEY_ENTRY(KEY_EMAIL),
    KEY_ENTRY(KEY_CHAT), KEY_ENTRY(KEY_SEARCH), KEY_ENTRY(KEY_CONNECT),
    KEY_ENTRY(KEY_FINANCE), KEY_ENTRY(KEY_SPORT), KEY_ENTRY(KEY_SHOP),
    KEY_ENTRY(KEY_ALTERASE), KEY_ENTRY(KEY_CANCEL), KEY_ENTRY(KEY_BRIGHTNESSDOWN),
    KEY_ENTRY(KEY_BRIGHTNESSUP), KEY_ENTRY(KEY_MEDIA), KEY_ENTRY(KEY_SWITCHVIDEOMODE),
    KEY_ENTRY(KEY_KBDILLUMTOGGLE), KEY_ENTRY(KEY_KBDILLUMDOWN), KEY_ENTRY(KEY_KBDILLUMUP),
    KEY_ENTRY(KEY_SEND), KEY_ENTRY(KEY_REPLY), KEY_ENTRY(KEY_FORWARDMAIL),
    KEY_ENTRY(KEY_SAVE), KEY_ENTRY(KEY_DOCUMENTS), KEY_ENTRY(KEY_BATTERY),
    KEY_ENTRY(KEY_BLUETOOTH), KEY_ENTRY(KEY_WLAN), KEY_ENTRY(KEY_UWB),
    KEY_ENTRY(KEY_UNKNOWN), KEY_ENTRY(KEY_VIDEO_NEXT), KEY_ENTRY(KEY_VIDEO_PREV),
    KEY_ENTRY(KEY_BRIGHTNESS_CYCLE), KEY_ENTRY(KEY_BRIGHTNESS_AUTO), KEY_ENTRY(KEY_BRIGHTNESS_ZERO),
    KEY_ENTRY(KEY_DISPLAY_OFF), KEY_ENTRY(KEY_WWAN), KEY_ENTRY(KEY_WIMAX),
    KEY_ENTRY(KEY_RFKILL), KEY_ENTRY(KEY_MICMUTE), KEY_ENTRY(BTN_MISC),
    KEY_ENTRY(BTN_0), KEY_ENTRY(BTN_1), KEY_ENTRY(BTN_2),
    KEY_ENTRY(BTN_3), KEY_ENTRY(BTN_4), KEY_ENTRY(BTN_5),
    KEY_ENTRY(BTN_6), KEY_ENTRY(BTN_7), KEY_ENTRY(BTN_8),
    KEY_ENTRY(BTN_9), KEY_ENTRY(BTN_MOUSE), KEY_ENTRY(BTN_LEFT),
    KEY_ENTRY(BTN_RIGHT), KEY_ENTRY(BTN_MIDDLE), KEY_ENTRY(BTN_SIDE),
    KEY_ENTRY(BTN_EXTRA), KEY_ENTRY(BTN_FORWARD), KEY_ENTRY(BTN_BACK),
    KEY_ENTRY(BTN_TASK), KEY_ENTRY(BTN_JOYSTICK), KEY_ENTRY(BTN_TRIGGER),
    KEY_ENTRY(BTN_THUMB), KEY_ENTRY(BTN_THUMB2), KEY_ENTRY(BTN_TOP),
    KEY_ENTRY(BTN_TOP2), KEY_ENTRY(BTN_PINKIE), KEY_ENTRY(BTN_BASE),
    KEY_ENTRY(BTN_BASE2), KEY_ENTRY(BTN_BASE3), KEY_ENTRY(BTN_BASE4),
    KEY_ENTRY(BTN_BASE5), KEY_ENTRY(BTN_BASE6), KEY_ENTRY(BTN_DEAD),
    KEY_ENTRY(BTN_GAMEPAD), KEY_ENTRY(BTN_SOUTH), KEY_ENTRY(BTN_A),
    KEY_ENTRY(BTN_EAST), KEY_ENTRY(BTN_B), KEY_ENTRY(BTN_C),
    KEY_ENTRY(BTN_NORTH), KEY_ENTRY(BTN_X), KEY_ENTRY(BTN_WEST),
    KEY_ENTRY(BTN_Y), KEY_ENTRY(BTN_Z), KEY_ENTRY(BTN_TL),
    KEY_ENTRY(BTN_TR), KEY_ENTRY(BTN_TL2), KEY_ENTRY(BTN_TR2),
    KEY_ENTRY(BTN_SELECT), KEY_ENTRY(BTN_START), KEY_ENTRY(BTN_MODE),
    KEY_ENTRY(BTN_THUMBL), KEY_ENTRY(BTN_THUMBR), KEY_ENTRY(BTN_DIGI),
    KEY_ENTRY(BTN_TOOL_PEN), KEY_ENTRY(BTN_TOOL_RUBBER), KEY_ENTRY(BTN_TOOL_BRUSH),
    KEY_ENTRY(BTN_TOOL_PENCIL), KEY_ENTRY(BTN_TOOL_AIRBRUSH), KEY_ENTRY(BTN_TOOL_FINGER),
    KEY_ENTRY(BTN_TOOL_MOUSE), KEY_ENTRY(BTN_TOOL_LENS), KEY_ENTRY(BTN_TOOL_QUINTTAP),
    KEY_ENTRY(BTN_STYLUS3), KEY_ENTRY(BTN_TOUCH), KEY_ENTRY(BTN_STYLUS),
    KEY_ENTRY(BTN_STYLUS2), KEY_ENTRY(BTN_TOOL_DOUBLETAP), KEY_ENTRY(BTN_TOOL_TRIPLETAP),
    KEY_ENTRY(BTN_TOOL_QUADTAP), KEY_ENTRY(BTN_WHEEL), KEY_ENTRY(BTN_GEAR_DOWN),
    KEY_ENTRY(BTN_GEAR_UP), KEY_ENTRY(KEY_OK), KEY_ENTRY(KEY_SELECT),
    KEY_ENTRY(KEY_GOTO), KEY_ENTRY(KEY_CLEAR), KEY_ENTRY(KEY_POWER2),
    KEY_ENTRY(KEY_OPTION), KEY_ENTRY(KEY_INFO), KEY_ENTRY(KEY_TIME),
    KEY_ENTRY(KEY_VENDOR), KEY_ENTRY(KEY_ARCHIVE), KEY_ENTRY(KEY_PROGRAM),
    KEY_ENTRY(KEY_CHANNEL), KEY_ENTRY(KEY_FAVORITES), KEY_ENTRY(KEY_EPG),
    KEY_ENTRY(KEY_PVR), KEY_ENTRY(KEY_MHP), KEY_ENTRY(KEY_LANGUAGE),
    KEY_ENTRY(KEY_TITLE), KEY_ENTRY(KEY_SUBTITLE), KEY_ENTRY(KEY_ANGLE),
    KEY_ENTRY(KEY_FULL_SCREEN), KEY_ENTRY(KEY_ZOOM), KEY_ENTRY(KEY_MODE),
    KEY_ENTRY(KEY_KEYBOARD), KEY_ENTRY(KEY_ASPECT_RATIO), KEY_ENTRY(KEY_SCREEN),
    KEY_ENTRY(KEY_PC), KEY_ENTRY(KEY_TV), KEY_ENTRY(KEY_TV2),
    KEY_ENTRY(KEY_VCR), KEY_ENTRY(KEY_VCR2), KEY_ENTRY(KEY_SAT),
    KEY_ENTRY(KEY_SAT2), KEY_ENTRY(KEY_CD), KEY_ENTRY(KEY_TAPE),
    KEY_ENTRY(KEY_RADIO), KEY_ENTRY(KEY_TUNER), KEY_ENTRY(KEY_PLAYER),
    KEY_ENTRY(KEY_TEXT), KEY_ENTRY(KEY_DVD), KEY_ENTRY(KEY_AUX),
    KEY_ENTRY(KEY_MP3), KEY_ENTRY(KEY_AUDIO), KEY_ENTRY(KEY_VIDEO),
    KEY_ENTRY(KEY_DIRECTORY), KEY_ENTRY(KEY_LIST), KEY_ENTRY(KEY_MEMO),
    KEY_ENTRY(KEY_CALENDAR), KEY_ENTRY(KEY_RED), KEY_ENTRY(KEY_GREEN),
    KEY_ENTRY(KEY_YELLOW), KEY_ENTRY(KEY_BLUE), KEY_ENTRY(KEY_CHANNELUP),
    KEY_ENTRY(KEY_CHANNELDOWN), KEY_ENTRY(KEY_FIRST), KEY_ENTRY(KEY_LAST),
    KEY_ENTRY(KEY_AB), KEY_ENTRY(KEY_NEXT), KEY_ENTRY(KEY_RESTART),
    KEY_ENTRY(KEY_SLOW), KEY_ENTRY(KEY_SHUFFLE), KEY_ENTRY(KEY_BREAK),
    KEY_ENTRY(KEY_PREVIOUS), KEY_ENTRY(KEY_DIGITS), KEY_ENTRY(KEY_TEEN),
    KEY_ENTRY(KEY_TWEN), KEY_ENTRY(KEY_VIDEOPHONE), KEY_ENTRY(KEY_GAMES),
    KEY_ENTRY(KEY_ZOOMIN), KEY_ENTRY(KEY_ZOOMOUT), KEY_ENTRY(KEY_ZOOMRESET),
    KEY_ENTRY(KEY_WORDPROCESSOR), KEY_ENTRY(KEY_EDITOR), KEY_ENTRY(KEY_SPREADSHEET),
    KEY_ENTRY(KEY_GRAPHICSEDITOR), KEY_ENTRY(KEY_PRESENTATION), KEY_ENTRY(KEY_DATABASE),
    KEY_ENTRY(KEY_NEWS), KEY_ENTRY(KEY_VOICEMAIL), KEY_ENTRY(KEY_ADDRESSBOOK),
    KEY_ENTRY(KEY_MESSENGER), KEY_ENTRY(KEY_DISPLAYTOGGLE), KEY_ENTRY(KEY_BRIGHTNESS_TOGGLE),
    KEY_ENTRY(KEY_SPELLCHECK), KEY_ENTRY(KEY_LOGOFF), KEY_ENTRY(KEY_DOLLAR),
    KEY_ENTRY(KEY_EURO), KEY_ENTRY(KEY_FRAMEBACK), KEY_ENTRY(KEY_FRAMEFORWARD),
    KEY_ENTRY(KEY_CONTEXT_MENU), KEY_ENTRY(KEY_MEDIA_REPEAT), KEY_ENTRY(KEY_10CHANNELSUP),
    KEY_ENTRY(KEY_10CHANNELSDOWN), KEY_ENTRY(KEY_IMAGES), KEY_ENTRY(KEY_NOTIFICATION_CENTER),
    KEY_ENTRY(KEY_PICKUP_PHONE), KEY_ENTRY(KEY_HANGUP_PHONE), KEY_ENTRY(KEY_LINK_PHONE),
    KEY_ENTRY(KEY_DEL_EOL), KEY_ENTRY(KEY_DEL_EOS), KEY_ENTRY(KEY_INS_LINE),
    KEY_ENTRY(KEY_DEL_LINE), KEY_ENTRY(KEY_FN), KEY_ENTRY(KEY_FN_ESC),
    KEY_ENTRY(KEY_FN_F1), KEY_ENTRY(KEY_FN_F2), KEY_ENTRY(KEY_FN_F3),
    KEY_ENTRY(KEY_FN_F4), KEY_ENTRY(KEY_FN_F5), KEY_ENTRY(KEY_FN_F6),
    KEY_ENTRY(KEY_FN_F7), KEY_ENTRY(KEY_FN_F8), KEY_ENTRY(KEY_FN_F9),
    KEY_ENTRY(KEY_FN_F10), KEY_ENTRY(KEY_FN_F11), KEY_ENTRY(KEY_FN_F12),
    KEY_ENTRY(KEY_FN_1), KEY_ENTRY(KEY_FN_2), KEY_ENTRY(KEY_FN_D),
    KEY_ENTRY(KEY_FN_E), KEY_ENTRY(KEY_FN_F), KEY_ENTRY(KEY_FN_S),
    KEY_ENTRY(KEY_FN_B), KEY_ENTRY(KEY_FN_RIGHT_SHIFT), KEY_ENTRY(KEY_BRL_DOT1),
    KEY_ENTRY(KEY_BRL_DOT2), KEY_ENTRY(KEY_BRL_DOT3), KEY_ENTRY(KEY_BRL_DOT4),
    KEY_ENTRY(KEY_BRL_DOT5), KEY_ENTRY(KEY_BRL_DOT6), KEY_ENTRY(KEY_BRL_DOT7),
    KEY_ENTRY(KEY_BRL_DOT8), KEY_ENTRY(KEY_BRL_DOT9), KEY_ENTRY(KEY_BRL_DOT10),
    KEY_ENTRY(KEY_NUMERIC_0), KEY_ENTRY(KEY_NUMERIC_1), KEY_ENTRY(KEY_NUMERIC_2),
    KEY_ENTRY(KEY_NUMERIC_3), KEY_ENTRY(KEY_NUMERIC_4), KEY_ENTRY(KEY_NUMERIC_5),
    KEY_ENTRY(KEY_NUMERIC_6), KEY_ENTRY(KEY_NUMERIC_7), KEY_ENTRY(KEY_NUMERIC_8),
    KEY_ENTRY(KEY_NUMERIC_9), KEY_ENTRY(KEY_NUMERIC_STAR), KEY_ENTRY(KEY_NUMERIC_POUND),
    KEY_ENTRY(KEY_NUMERIC_A), KEY_ENTRY(KEY_NUMERIC_B), KEY_ENTRY(KEY_NUMERIC_C),
    KEY_ENTRY(KEY_NUMERIC_D), KEY_ENTRY(KEY_CAMERA_FOCUS), KEY_ENTRY(KEY_WPS_BUTTON),
    KEY_ENTRY(KEY_TOUCHPAD_TOGGLE), KEY_ENTRY(KEY_TOUCHPAD_ON), KEY_ENTRY(KEY_TOUCHPAD_OFF),
    KEY_ENTRY(KEY_CAMERA_ZOOMIN), KEY_ENTRY(KEY_CAMERA_ZOOMOUT), KEY_ENTRY(KEY_CAMERA_UP),
    KEY_ENTRY(KEY_CAMERA_DOWN), KEY_ENTRY(KEY_CAMERA_LEFT), KEY_ENTRY(KEY_CAMERA_RIGHT),
    KEY_ENTRY(KEY_ATTENDANT_ON), KEY_ENTRY(KEY_ATTENDANT_OFF), KEY_ENTRY(KEY_ATTENDANT_TOGGLE),
    KEY_ENTRY(KEY_LIGHTS_TOGGLE), KEY_ENTRY(BTN_DPAD_UP), KEY_ENTRY(BTN_DPAD_DOWN),
    KEY_ENTRY(BTN_DPAD_LEFT), KEY_ENTRY(BTN_DPAD_RIGHT), KEY_ENTRY(KEY_ALS_TOGGLE),
    KEY_ENTRY(KEY_ROTATE_LOCK_TOGGLE), KEY_ENTRY(KEY_REFRESH_RATE_TOGGLE), KEY_ENTRY(KEY_BUTTONCONFIG),
    KEY_ENTRY(KEY_TASKMANAGER), KEY_ENTRY(KEY_JOURNAL), KEY_ENTRY(KEY_CONTROLPANEL),
    KEY_ENTRY(KEY_APPSELECT), KEY_ENTRY(KEY_SCREENSAVER), KEY_ENTRY(KEY_VOICECOMMAND),
    KEY_ENTRY(KEY_ASSISTANT), KEY_ENTRY(KEY_KBD_LAYOUT_NEXT), KEY_ENTRY(KEY_EMOJI_PICKER),
    KEY_ENTRY(KEY_DICTATE), KEY_ENTRY(KEY_BRIGHTNESS_MIN), KEY_ENTRY(KEY_BRIGHTNESS_MAX),
    KEY_ENTRY(KEY_KBDINPUTASSIST_PREV), KEY_ENTRY(KEY_KBDINPUTASSIST_NEXT), KEY_ENTRY(KEY_KBDINPUTASSIST_PREVGROUP),
    KEY_ENTRY(KEY_KBDINPUTASSIST_NEXTGROUP), KEY_ENTRY(KEY_KBDINPUTASSIST_ACCEPT), KEY_ENTRY(KEY_KBDINPUTASSIST_CANCEL),
    KEY_ENTRY(KEY_RIGHT_UP), KEY_ENTRY(KEY_RIGHT_DOWN), KEY_ENTRY(KEY_LEFT_UP),
    KEY_ENTRY(KEY_LEFT_DOWN), KEY_ENTRY(KEY_ROOT_MENU), KEY_ENTRY(KEY_MEDIA_TOP_MENU),
    KEY_ENTRY(KEY_NUMERIC_11), KEY_ENTRY(KEY_NUMERIC_12), KEY_ENTRY(KEY_AUDIO_DESC),
    KEY_ENTRY(KEY_3D_MODE), KEY_ENTRY(KEY_NEXT_FAVORITE), KEY_ENTRY(KEY_STOP_RECORD),
    KEY_ENTRY(KEY_PAUSE_RECORD), KEY_ENTRY(KEY_VOD), KEY_ENTRY(KEY_UNMUTE),
    KEY_ENTRY(KEY_FASTREVERSE), KEY_ENTRY(KEY_SLOWREVERSE), KEY_ENTRY(KEY_DATA),
    KEY_ENTRY(KEY_ONSCREEN_KEYBOARD), KEY_ENTRY(KEY_PRIVACY_SCREEN_TOGGLE), KEY_ENTRY(KEY_SELECTIVE_SCREENSHOT),
    KEY_ENTRY(KEY_NEXT_ELEMENT), KEY_ENTRY(KEY_PREVIOUS_ELEMENT), KEY_ENTRY(KEY_AUTOPILOT_ENGAGE_TOGGLE),
    KEY_ENTRY(KEY_MARK_WAYPOINT), KEY_ENTRY(KEY_SOS), KEY_ENTRY(KEY_NAV_CHART),
    KEY_ENTRY(KEY_FISHING_CHART), KEY_ENTRY(KEY_SINGLE_RANGE_RADAR), KEY_ENTRY(KEY_DUAL_RANGE_RADAR),
    KEY_ENTRY(KEY_RADAR_OVERLAY), KEY_ENTRY(KEY_TRADITIONAL_SONAR), KEY_ENTRY(KEY_CLEARVU_SONAR),
    KEY_ENTRY(KEY_SIDEVU_SONAR), KEY_ENTRY(KEY_NAV_INFO), KEY_ENTRY(KEY_BRIGHTNESS_MENU),
    KEY_ENTRY(KEY_MACRO1), KEY_ENTRY(KEY_MACRO2), KEY_ENTRY(KEY_MACRO3),
    KEY_ENTRY(KEY_MACRO4), KEY_ENTRY(KEY_MACRO5), KEY_ENTRY(KEY_MACRO6),
    KEY_ENTRY(KEY_MACRO7), KEY_ENTRY(KEY_MACRO8), KEY_ENTRY(KEY_MACRO9),
    KEY_ENTRY(KEY_MACRO10), KEY_ENTRY(KEY_MACRO11), KEY_ENTRY(KEY_MACRO12),
    KEY_ENTRY(KEY_MACRO13), KEY_ENTRY(KEY_MACRO14), KEY_ENTRY(KEY_MACRO15),
    KEY_ENTRY(KEY_MACRO16), KEY_ENTRY(KEY_MACRO17), KEY_ENTRY(KEY_MACRO18),
    KEY_ENTRY(KEY_MACRO19), KEY_ENTRY(KEY_MACRO20), KEY_ENTRY(KEY_MACRO21),
    KEY_ENTRY(KEY_MACRO22), KEY_ENTRY(KEY_MACRO23), KEY_ENTRY(KEY_MACRO24),
    KEY_ENTRY(KEY_MACRO25), KEY_ENTRY(KEY_MACRO26), KEY_ENTRY(KEY_MACRO27),
    KEY_ENTRY(KEY_MACRO28), KEY_ENTRY(KEY_MACRO29), KEY_ENTRY(KEY_MACRO30),
    KEY_ENTRY(KEY_MACRO_RECORD_START), KEY_ENTRY(KEY_MACRO_RECORD_STOP), KEY_ENTRY(KEY_MACRO_PRESET_CYCLE),
    KEY_ENTRY(KEY_MACRO_PRESET1), KEY_ENTRY(KEY_MACRO_PRESET2), KEY_ENTRY(KEY_MACRO_PRESET3),
    KEY_ENTRY(KEY_KBD_LCD_MENU1), KEY_ENTRY(KEY_KBD_LCD_MENU2), KEY_ENTRY(KEY_KBD_LCD_MENU3),
    KEY_ENTRY(KEY_KBD_LCD_MENU4), KEY_ENTRY(KEY_KBD_LCD_MENU5), KEY_ENTRY(BTN_TRIGGER_HAPPY),
    KEY_ENTRY(BTN_TRIGGER_HAPPY1), KEY_ENTRY(BTN_TRIGGER_HAPPY2), KEY_ENTRY(BTN_TRIGGER_HAPPY3),
    KEY_ENTRY(BTN_TRIGGER_HAPPY4), KEY_ENTRY(BTN_TRIGGER_HAPPY5), KEY_ENTRY(BTN_TRIGGER_HAPPY6),
    KEY_ENTRY(BTN_TRIGGER_HAPPY7), KEY_ENTRY(BTN_TRIGGER_HAPPY8), KEY_ENTRY(BTN_TRIGGER_HAPPY9),
    KEY_ENTRY(BTN_TRIGGER_HAPPY10), KEY_ENTRY(BTN_TRIGGER_HAPPY11), KEY_ENTRY(BTN_TRIGGER_HAPPY12),
    KEY_ENTRY(BTN_TRIGGER_HAPPY13), KEY_ENTRY(BTN_TRIGGER_HAPPY14), KEY_ENTRY(BTN_TRIGGER_HAPPY15),
    KEY_ENTRY(BTN_TRIGGER_HAPPY16), KEY_ENTRY(BTN_TRIGGER_HAPPY17), KEY_ENTRY(BTN_TRIGGER_HAPPY18),
    KEY_ENTRY(BTN_TRIGGER_HAPPY19), KEY_ENTRY(BTN_TRIGGER_HAPPY20), KEY_ENTRY(BTN_TRIGGER_HAPPY21),
    KEY_ENTRY(BTN_TRIGGER_HAPPY22), KEY_ENTRY(BTN_TRIGGER_HAPPY23), KEY_ENTRY(BTN_TRIGGER_HAPPY24),
    KEY_ENTRY(BTN_TRIGGER_HAPPY25), KEY_ENTRY(BTN_TRIGGER_HAPPY26), KEY_ENTRY(BTN_TRIGGER_HAPPY27),
    KEY_ENTRY(BTN_TRIGGER_HAPPY28), KEY_ENTRY(BTN_TRIGGER_HAPPY29), KEY_ENTRY(BTN_TRIGGER_HAPPY30),
    KEY_ENTRY(BTN_TRIGGER_HAPPY31), KEY_ENTRY(BTN_TRIGGER_HAPPY32), KEY_ENTRY(BTN_TRIGGER_HAPPY33),
    KEY_ENTRY(BTN_TRIGGER_HAPPY34), KEY_ENTRY(BTN_TRIGGER_HAPPY35), KEY_ENTRY(BTN_TRIGGER_HAPPY36),
    KEY_ENTRY(BTN_TRIGGER_HAPPY37), KEY_ENTRY(BTN_TRIGGER_HAPPY38), KEY_ENTRY(BTN_TRIGGER_HAPPY39),
    KEY_ENTRY(BTN_TRIGGER_HAPPY40),
};

#undef KEY_ENTRY

} // namespace

std::optional<KeyCode> KeyCode::parse(const std::string& text) {
    for (const auto& entry : kKeyNames) {
        if (text == entry.name) {
            return KeyCode(entry.code);
        }
    }

    // Raw numeric code
    if (text.empty() || text.size() > 5) {
        return std::nullopt;
    }
    unsigned long value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + static_cast<unsigned long>(c - '0');
    }
    if (value > std::numeric_limits<std::uint16_t>::max()) {
        return std::nullopt;
    }
    return KeyCode(static_cast<std::uint16_t>(value));
}

std::string KeyCode::name() const {
    for (const auto& entry : kKeyNames) {
        if (entry.code == code_) {
            return entry.name;
        }
    }
    return "KEY_UNKNOWN(" + std::to_string(code_) + ")";
}

std::ostream& operator<<(std::ostream& os, KeyCode key) {
    return os << key.name();
}

} // namespace Evdev
