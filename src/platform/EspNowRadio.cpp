#include "EspNowRadio.h"
#include <WiFi.h>
#include <esp_wifi.h>
#include <string.h>

EspNowRadio* EspNowRadio::instance = nullptr;

EspNowRadio::EspNowRadio(ILogger* log) : logger(log), channel(1), sink(nullptr) {
}

EspNowRadio::~EspNowRadio() {
    if (instance == this) {
        esp_now_unregister_recv_cb();
        esp_now_deinit();
        instance = nullptr;
    }
}

bool EspNowRadio::begin(uint8_t ch) {
    channel = ch;

    // The access point must share this channel while associated.
    WiFi.mode(WIFI_STA);
    esp_err_t err = esp_wifi_set_channel(channel, WIFI_SECOND_CHAN_NONE);
    if (err != ESP_OK) {
        if (logger) logger->errorf("esp_wifi_set_channel(%u) failed: %d", (unsigned)channel, (int)err);
        return false;
    }

    err = esp_now_init();
    if (err != ESP_OK) {
        if (logger) logger->errorf("esp_now_init failed: %d", (int)err);
        return false;
    }

    instance = this;
    esp_now_register_recv_cb(&EspNowRadio::onReceive);

    if (logger) logger->infof("ESP-NOW up, station MAC %s", WiFi.macAddress().c_str());
    return true;
}

bool EspNowRadio::addPeer(const uint8_t* mac) {
    esp_now_peer_info_t peer;
    memset(&peer, 0, sizeof(peer));
    memcpy(peer.peer_addr, mac, ESP_NOW_ETH_ALEN);
    peer.channel = channel;
    peer.ifidx = WIFI_IF_STA;
    peer.encrypt = false;

    if (esp_now_is_peer_exist(mac)) return true;

    esp_err_t err = esp_now_add_peer(&peer);
    if (err != ESP_OK) {
        if (logger) logger->errorf("esp_now_add_peer failed: %d", (int)err);
        return false;
    }
    return true;
}

bool EspNowRadio::send(const uint8_t* mac, const uint8_t* data, size_t length) {
    return esp_now_send(mac, data, length) == ESP_OK;
}

void EspNowRadio::onReceive(const esp_now_recv_info_t* info, const uint8_t* data, int length) {
    if (!instance || !instance->sink || !info || length <= 0) return;
    instance->sink->onRelayFrame(info->src_addr, data, (size_t)length);
}
