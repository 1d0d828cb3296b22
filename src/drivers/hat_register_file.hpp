#ifndef HAT_REGISTER_FILE_HPP
#define HAT_REGISTER_FILE_HPP

#include "hal_i2c.hpp"
#include "hat_frame.hpp"
#include "hat_registers.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

// Acesso aos registradores de uma placa, um quadro por operacao.
// Dono exclusivo do transporte; um mutex serializa toda transacao no handle
// (thread do CWDT + chamadas da aplicacao), inclusive o par escrita/leitura
// de um quadro. Direcao e largura sao verificadas antes de tocar no barramento.
// CRC, id, comando ou eco divergente na resposta -> TransferError, sem repeticao.
class HatRegisterFile
{
public:
    explicit HatRegisterFile(std::unique_ptr<I2cTransport> transport);

    HatRegisterFile(const HatRegisterFile&) = delete;
    HatRegisterFile& operator=(const HatRegisterFile&) = delete;

    uint8_t address() const { return _transport->address(); }

    uint32_t read(const HatRegister& reg);

    // Largura 0 (comandos sem valor): so aceita 0
    void write(const HatRegister& reg, uint32_t value);

    // Registradores de bloco (nome da placa, versao de firmware)
    std::vector<uint8_t> read_block(const HatRegister& reg);

private:
    std::unique_ptr<I2cTransport> _transport;
    std::mutex _bus_mutex;
    uint8_t _frame_id{static_cast<uint8_t>(HAT_FIRST_FRAME_ID - 1)};

    // Envia o quadro e devolve os dados da resposta (vazio se a placa nao responde)
    std::vector<uint8_t> transfer(uint8_t command, const std::vector<uint8_t>& data, size_t response_size,
                                  bool acknowledged, const char* name);

    std::vector<uint8_t> read_payload(const HatRegister& reg);

    static void check_readable(const HatRegister& reg);
    static void check_writable(const HatRegister& reg);
};

#endif
