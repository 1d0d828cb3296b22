#ifndef HAT_FRAME_HPP
#define HAT_FRAME_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

/* Quadro trocado com a I2C-HAT:
 *   [id][comando][dados ...][crc lo][crc hi]
 * CRC16 Modbus sobre id + comando + dados. A resposta repete id e comando da requisicao. */
// Id do primeiro quadro apos abrir a placa; incrementa a cada transacao, com volta em 0xFF
#define HAT_FIRST_FRAME_ID 0x1F

struct HatFrame
{
    static constexpr size_t OVERHEAD = 4; // id + comando + crc

    uint8_t id{0};
    uint8_t command{0};
    std::vector<uint8_t> data;

    std::vector<uint8_t> encode() const;

    // Verifica tamanho minimo e CRC; TransferError se invalido
    static HatFrame decode(const std::vector<uint8_t>& raw);
};

uint16_t crc16_modbus(const uint8_t* data, size_t length);

#endif
