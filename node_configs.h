// Per-node deployment settings. Copy, edit and flash one set per node.
#ifndef NODE_CONFIGS_H
#define NODE_CONFIGS_H

// Identity
#define NODE_CONFIG_TEAM_ID      "Team_A"
#define NODE_CONFIG_WEARER_ID    "FF_A"
#define NODE_CONFIG_NODE_ID      "node-A"
#define NODE_CONFIG_RELAY_ID     1

// WiFi credentials, tried in order. Leave unused SSIDs empty.
#define NODE_CONFIG_WIFI_SSID_1      "incident-net"
#define NODE_CONFIG_WIFI_PASSWORD_1  "change-me"
#define NODE_CONFIG_WIFI_SSID_2      "engine-hotspot"
#define NODE_CONFIG_WIFI_PASSWORD_2  "change-me"
#define NODE_CONFIG_WIFI_SSID_3      ""
#define NODE_CONFIG_WIFI_PASSWORD_3  ""

// MQTT broker on the edge gateway
#define NODE_CONFIG_MQTT_HOST        "192.168.2.10"
#define NODE_CONFIG_MQTT_PORT        1883
#define NODE_CONFIG_MQTT_USERNAME    ""
#define NODE_CONFIG_MQTT_PASSWORD    ""

// ESP-NOW relay link. All siblings share the channel.
#define NODE_CONFIG_RELAY_CHANNEL    1

// Sibling B
#define NODE_CONFIG_SIBLING_1_MAC        { 0x24, 0x6F, 0x28, 0x00, 0x00, 0x02 }
#define NODE_CONFIG_SIBLING_1_RELAY_ID   2
#define NODE_CONFIG_SIBLING_1_NODE_ID    "node-B"
#define NODE_CONFIG_SIBLING_1_TEAM_ID    "Team_A"
#define NODE_CONFIG_SIBLING_1_WEARER_ID  "FF_B"

// Wearable strap advertised name prefix
#define NODE_CONFIG_WEARABLE_PREFIX  "Polar H10"

#endif
