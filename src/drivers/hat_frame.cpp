#include "hat_frame.hpp"
#include "hat_error.hpp"
#include <cstdio>

uint16_t crc16_modbus(const uint8_t* data, size_t length)
{
    uint16_t crc = 0xFFFF;
    for(size_t i = 0; i < length; i++)
    {
        crc ^= data[i];
        for(int bit = 0; bit < 8; bit++)
        {
            if(crc & 0x0001)
                crc = static_cast<uint16_t>((crc >> 1) ^ 0xA001);
            else
                crc = static_cast<uint16_t>(crc >> 1);
        }
    }
    return crc;
}

std::vector<uint8_t> HatFrame::encode() const
{
    std::vector<uint8_t> raw;
    raw.reserve(data.size() + OVERHEAD);
    raw.push_back(id);
    raw.push_back(command);
    raw.insert(raw.end(), data.begin(), data.end());

    uint16_t crc = crc16_modbus(raw.data(), raw.size());
    raw.push_back(static_cast<uint8_t>(crc & 0xFF));
    raw.push_back(static_cast<uint8_t>((crc >> 8) & 0xFF));
    return raw;
}

HatFrame HatFrame::decode(const std::vector<uint8_t>& raw)
{
    if(raw.size() < OVERHEAD)
        throw HatError(HatErrorKind::TransferError, "quadro curto: " + std::to_string(raw.size()) + " bytes");

    size_t body = raw.size() - 2;
    uint16_t expected = crc16_modbus(raw.data(), body);
    uint16_t received = static_cast<uint16_t>(raw[body] | (raw[body + 1] << 8));
    if(expected != received)
    {
        char buf[48];
        std::snprintf(buf, sizeof(buf), "CRC invalido: 0x%04X, esperado 0x%04X", received, expected);
        throw HatError(HatErrorKind::TransferError, buf);
    }

    HatFrame frame;
    frame.id = raw[0];
    frame.command = raw[1];
    frame.data.assign(raw.begin() + 2, raw.begin() + body);
    return frame;
}
