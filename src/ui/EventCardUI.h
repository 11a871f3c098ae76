#ifndef EVENT_CARD_UI_H
#define EVENT_CARD_UI_H

#include <Arduino.h>

// Boxed event cards and indented link/vitals trees on the serial port.
class EventCardUI {
private:
    struct Glyphs {
        const char* open;
        const char* close;
        const char* rule;
        const char* side;
        const char* bottomOpen;
        const char* bottomClose;
        const char* branch;
        const char* lastBranch;
        const char* ok;
        const char* fail;
    };

    static const Glyphs UNICODE_GLYPHS;
    static const Glyphs ASCII_GLYPHS;
    static constexpr int CARD_WIDTH = 58;
    static constexpr int KEY_WIDTH = 10;

    const Glyphs* glyphs;
    bool cardOpen;

    void rule(int count) const;
    void closeCard();
    void treeRow(bool last, const char* label, const char* value, const char* note = nullptr) const;

public:
    explicit EventCardUI(bool unicode = true);

    void cardHeader(const char* title, const char* prefix = "EVENT");
    void cardKV(const char* key, const char* value);
    void cardKVf(const char* key, const char* format, ...);
    void cardFooter();

    void printLinkStatus(const char* uplinkState, const char* ssid, int rssi, bool sessionReady,
                         const char* broker, const char* mode, unsigned relayPeers,
                         const char* wearablePhase);
    void printVitals(float bpm, float rrMs, float rmssdMs, float sdnnMs, float tempC);
    void printModeTransition(const char* from, const char* to, const char* relayNode);
    void printCommandResult(const char* command, bool ok, const char* detail);

    void setUnicode(bool unicode) { glyphs = unicode ? &UNICODE_GLYPHS : &ASCII_GLYPHS; }
};

#endif
