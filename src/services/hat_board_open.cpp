#include "hat_board.hpp"

std::unique_ptr<HatBoard> HatBoard::open(const HatBoardType& type, int address, const CwdtPolicy& policy,
                                         const std::string& bus_path, LogSink log)
{
    // Endereco validado antes de abrir o barramento
    validate_address(type, address);

    std::unique_ptr<I2cTransport> transport = std::make_unique<HalI2C>(bus_path.c_str(), address);
    return std::make_unique<HatBoard>(type, std::move(transport), policy, log);
}
