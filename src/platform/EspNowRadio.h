#ifndef ESP_NOW_RADIO_H
#define ESP_NOW_RADIO_H

#include <esp_now.h>
#include "../../include/ILogger.h"
#include "../../include/IRelayRadio.h"

// ESP-NOW on a fixed channel, unencrypted unicast to registered siblings.
class EspNowRadio : public IRelayRadio {
private:
    ILogger* logger;
    uint8_t channel;
    IRelayFrameSink* sink;

    // ESP-NOW takes a plain function; one radio per node.
    static EspNowRadio* instance;
    static void onReceive(const esp_now_recv_info_t* info, const uint8_t* data, int length);

public:
    explicit EspNowRadio(ILogger* log);
    ~EspNowRadio();

    bool begin(uint8_t channel) override;
    bool addPeer(const uint8_t* mac) override;
    bool send(const uint8_t* mac, const uint8_t* data, size_t length) override;
    void setReceiver(IRelayFrameSink* frameSink) override { sink = frameSink; }
};

#endif
