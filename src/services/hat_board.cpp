#include "hat_board.hpp"
#include "hat_error.hpp"
#include <cstdio>

HatStatus HatStatus::decode(uint32_t word)
{
    HatStatus status;
    status.raw = word;
    status.cwdt_timeout = (word & HAT_STATUS_CWDT_TIMEOUT) != 0;
    status.comm_error = (word & HAT_STATUS_COMM_ERROR) != 0;
    status.irq_overflow = (word & HAT_STATUS_IRQ_OVERFLOW) != 0;
    return status;
}

HatBoard::HatBoard(const HatBoardType& type, std::unique_ptr<I2cTransport> transport, const CwdtPolicy& policy,
                   LogSink log)
    : _map(type), _log(log), _regs(std::move(transport))
{
    validate_address(type, _regs.address());

    _name = read_name();
    if(_name != type.name)
    {
        throw HatError(HatErrorKind::BoardMismatch,
                       "nome inesperado: '" + _name + "', esperado: '" + std::string(type.name) + "'");
    }
    _firmware_version = read_firmware_version();

    if(_map.has_di())
        _di = std::make_unique<HatDigitalInputs>(_regs, _map);
    if(_map.has_dq())
        _dq = std::make_unique<HatDigitalOutputs>(_regs, _map);
    if(_map.has_irq())
        _irq = std::make_unique<HatIrq>(_regs, _map);

    _cwdt = std::make_unique<HatCwdt>(_regs, _map, _log);
    _cwdt->apply(policy);

    _log(LogLevel::Info, "HAT", to_string() + " " + _firmware_version);
}

HatBoard::~HatBoard()
{
    if(_cwdt)
        _cwdt->stop_feeding();
}

std::string HatBoard::read_name()
{
    std::vector<uint8_t> data = _regs.read_block(_map.reg(HatField::BoardName));

    std::string name;
    for(uint8_t byte : data)
    {
        if(byte == 0)
            break;
        name += static_cast<char>(byte);
    }
    return name;
}

std::string HatBoard::read_firmware_version()
{
    std::vector<uint8_t> data = _regs.read_block(_map.reg(HatField::FirmwareVersion));
    return "v" + std::to_string(data[0]) + "." + std::to_string(data[1]) + "." + std::to_string(data[2]);
}

std::string HatBoard::to_string() const
{
    char adr[8];
    std::snprintf(adr, sizeof(adr), "0x%02X", address());
    return _name + " adr: " + adr;
}

HatStatus HatBoard::status()
{
    return HatStatus::decode(_regs.read(_map.reg(HatField::StatusWord)));
}

void HatBoard::reset()
{
    _regs.write(_map.reg(HatField::Reset), 0);
    _log(LogLevel::Info, "HAT", to_string() + ": reset enviado");
}

HatDigitalInputs& HatBoard::di()
{
    if(!_di)
        throw HatError(HatErrorKind::InvalidAccess, std::string(type().short_name) + " nao tem entradas digitais");
    return *_di;
}

HatDigitalOutputs& HatBoard::dq()
{
    if(!_dq)
        throw HatError(HatErrorKind::InvalidAccess, std::string(type().short_name) + " nao tem saidas digitais");
    return *_dq;
}

HatIrq& HatBoard::irq()
{
    if(!_irq)
        throw HatError(HatErrorKind::InvalidAccess, std::string(type().short_name) + " nao tem IRQ");
    return *_irq;
}
