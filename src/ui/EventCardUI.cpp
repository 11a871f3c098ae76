#include "EventCardUI.h"
#include <math.h>
#include <stdarg.h>

const EventCardUI::Glyphs EventCardUI::UNICODE_GLYPHS = {
    "╭", "╮", "─", "│", "╰", "╯", "├──", "└──", "✔", "✖"
};

const EventCardUI::Glyphs EventCardUI::ASCII_GLYPHS = {
    "+", "+", "-", "|", "+", "+", "|--", "`--", "[OK]", "[X]"
};

constexpr int EventCardUI::CARD_WIDTH;
constexpr int EventCardUI::KEY_WIDTH;

EventCardUI::EventCardUI(bool unicode) : glyphs(nullptr), cardOpen(false) {
    setUnicode(unicode);
}

void EventCardUI::rule(int count) const {
    while (count-- > 0) Serial.print(glyphs->rule);
}

void EventCardUI::closeCard() {
    Serial.print(glyphs->bottomOpen);
    rule(CARD_WIDTH + 2);
    Serial.println(glyphs->bottomClose);
    cardOpen = false;
}

void EventCardUI::cardHeader(const char* title, const char* prefix) {
    if (cardOpen) closeCard();

    char label[64];
    int length = snprintf(label, sizeof(label), " %s: %s ", prefix, title);
    if (length < 0) length = 0;
    if (length >= (int)sizeof(label)) length = sizeof(label) - 1;

    Serial.print(glyphs->open);
    rule(2);
    Serial.print(label);
    rule(CARD_WIDTH - length);
    Serial.println(glyphs->close);
    cardOpen = true;
}

void EventCardUI::cardKV(const char* key, const char* value) {
    const int valueWidth = CARD_WIDTH - 1 - KEY_WIDTH;
    Serial.printf("%s %-*.*s %-*.*s %s\n", glyphs->side, KEY_WIDTH, KEY_WIDTH, key, valueWidth,
                  valueWidth, value ? value : "", glyphs->side);
}

void EventCardUI::cardKVf(const char* key, const char* format, ...) {
    char value[96];
    va_list args;
    va_start(args, format);
    vsnprintf(value, sizeof(value), format, args);
    va_end(args);
    cardKV(key, value);
}

void EventCardUI::cardFooter() {
    if (cardOpen) closeCard();
}

void EventCardUI::treeRow(bool last, const char* label, const char* value, const char* note) const {
    Serial.printf("       %s %-6s %s", last ? glyphs->lastBranch : glyphs->branch, label,
                  value ? value : "-");
    if (note && *note) Serial.printf("  (%s)", note);
    Serial.println();
}

void EventCardUI::printLinkStatus(const char* uplinkState, const char* ssid, int rssi,
                                  bool sessionReady, const char* broker, const char* mode,
                                  unsigned relayPeers, const char* wearablePhase) {
    char note[48];

    snprintf(note, sizeof(note), "%s, %d dBm", ssid ? ssid : "-", rssi);
    treeRow(false, "wifi", uplinkState, note);
    treeRow(false, "broker", sessionReady ? "session up" : "no session", broker);
    snprintf(note, sizeof(note), "%u viable sibling(s)", relayPeers);
    treeRow(false, "mode", mode, note);
    treeRow(true, "strap", wearablePhase);
}

void EventCardUI::printVitals(float bpm, float rrMs, float rmssdMs, float sdnnMs, float tempC) {
    char value[48];

    if (isnan(bpm)) snprintf(value, sizeof(value), "no beat");
    else if (isnan(rrMs)) snprintf(value, sizeof(value), "%.0f bpm", bpm);
    else snprintf(value, sizeof(value), "%.0f bpm, RR %.0f ms", bpm, rrMs);
    treeRow(false, "heart", value);

    if (isnan(rmssdMs)) snprintf(value, sizeof(value), "collecting RR");
    else snprintf(value, sizeof(value), "RMSSD %.1f, SDNN %.1f ms", rmssdMs, sdnnMs);
    treeRow(false, "hrv", value);

    if (isnan(tempC)) snprintf(value, sizeof(value), "no reading");
    else snprintf(value, sizeof(value), "%.2f C", tempC);
    treeRow(true, "temp", value);
}

void EventCardUI::printModeTransition(const char* from, const char* to, const char* relayNode) {
    cardHeader("MODE CHANGE", "FAILOVER");
    cardKVf("mode", "%s -> %s", from, to);
    if (relayNode) cardKV("relay", relayNode);
    cardFooter();
}

void EventCardUI::printCommandResult(const char* command, bool ok, const char* detail) {
    Serial.printf("       %s %s: %s\n", ok ? glyphs->ok : glyphs->fail, command, detail);
}
