#pragma once
#include <stdint.h>
#include <stddef.h>

namespace gpsmodel {

namespace Protocol
{
    // UBX framing bytes
    constexpr uint8_t SYNC_CHAR1 = 0xB5;
    constexpr uint8_t SYNC_CHAR2 = 0x62;

    constexpr size_t HEADER_LEN = 4;    // class, id, length
    constexpr size_t CHECKSUM_LEN = 2;
    constexpr size_t MAX_PAYLOAD_LEN = 0xFFFF;

    // Message classes
    namespace Class {
        constexpr uint8_t ACK = 0x05;
        constexpr uint8_t CFG = 0x06;
    }

    namespace Ack {
        constexpr uint8_t NAK = 0x00;
        constexpr uint8_t ACK = 0x01;
    }

    namespace Cfg {
        constexpr uint8_t CFG = 0x09;
        constexpr uint8_t NAV5 = 0x24;

        // CFG-CFG section masks
        constexpr uint32_t SAVE_ALL_SECTIONS = 0x00001F1F;

        // CFG-CFG device masks
        constexpr uint8_t DEVICE_BBR = 1 << 0;
        constexpr uint8_t DEVICE_FLASH = 1 << 1;
        constexpr uint8_t DEVICE_EEPROM = 1 << 2;
        constexpr uint8_t DEVICE_SPI_FLASH = 1 << 4;
        constexpr uint8_t ALL_DEVICES = DEVICE_BBR | DEVICE_FLASH | DEVICE_EEPROM | DEVICE_SPI_FLASH;

        constexpr size_t CFG_PAYLOAD_LEN = 13;
        constexpr size_t NAV5_PAYLOAD_LEN = 36;
    }

    // Exchange
    constexpr int MAX_ATTEMPTS = 5;

    // Serial
    constexpr int POLL_INTERVAL_MS = 20;
    constexpr int REPLY_TIMEOUT_MS = 2000;
    constexpr int READ_BUDGET = 8192;   // channel reads per sync or exact read
    constexpr int DEFAULT_BAUD = 9600;
    constexpr const char* DEFAULT_DEVICE = "/dev/ttyACM0";
}

} // namespace gpsmodel
