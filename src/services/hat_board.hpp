#ifndef HAT_BOARD_HPP
#define HAT_BOARD_HPP

#include "hal_i2c.hpp"
#include "hat_cwdt.hpp"
#include "hat_digital.hpp"
#include "hat_irq.hpp"
#include "hat_log.hpp"
#include "hat_register_file.hpp"
#include "hat_registers.hpp"
#include <cstdint>
#include <memory>
#include <string>

struct HatStatus
{
    uint32_t raw;
    bool cwdt_timeout;  // saidas foram para o safety value
    bool comm_error;    // placa recebeu quadro invalido
    bool irq_overflow;  // fila de captura de IRQ cheia

    static HatStatus decode(uint32_t word);
};

// Uma I2C-HAT no barramento.
// Nome e versao de firmware sao lidos uma vez na construcao.
// Todas as chamadas sao sincronas e bloqueantes, um quadro por operacao.
class HatBoard
{
public:
    HatBoard(const HatBoardType& type, std::unique_ptr<I2cTransport> transport, const CwdtPolicy& policy,
             LogSink log = console_log_sink());
    ~HatBoard();

    HatBoard(const HatBoard&) = delete;
    HatBoard& operator=(const HatBoard&) = delete;

    // Abre /dev/i2c-N para o endereco informado (HalI2C)
    static std::unique_ptr<HatBoard> open(const HatBoardType& type, int address, const CwdtPolicy& policy,
                                          const std::string& bus_path = "/dev/i2c-1",
                                          LogSink log = console_log_sink());

    const HatBoardType& type() const { return _map.type(); }
    uint8_t address() const { return _regs.address(); }
    const std::string& name() const { return _name; }
    const std::string& firmware_version() const { return _firmware_version; }

    // "DI16ac I2C-HAT adr: 0x40"
    std::string to_string() const;

    HatStatus status();
    void reset();

    bool has_di() const { return _di != nullptr; }
    bool has_dq() const { return _dq != nullptr; }
    bool has_irq() const { return _irq != nullptr; }

    HatCwdt& cwdt() { return *_cwdt; }
    HatDigitalInputs& di();
    HatDigitalOutputs& dq();
    HatIrq& irq();

private:
    HatRegisterMap _map;
    LogSink _log;
    HatRegisterFile _regs;

    std::string _name;
    std::string _firmware_version;

    std::unique_ptr<HatDigitalInputs> _di;
    std::unique_ptr<HatDigitalOutputs> _dq;
    std::unique_ptr<HatIrq> _irq;

    // Ultimo membro: a thread de alimentacao para antes do transporte ser fechado
    std::unique_ptr<HatCwdt> _cwdt;

    std::string read_name();
    std::string read_firmware_version();
};

#endif
