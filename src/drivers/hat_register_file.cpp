#include "hat_register_file.hpp"
#include "hat_error.hpp"
#include <algorithm>
#include <cstdio>

static uint32_t max_value(uint8_t width)
{
    if(width == 0)
        return 0;
    return width >= 4 ? 0xFFFFFFFFu : (1u << (8 * width)) - 1u;
}

static std::string hex_byte(unsigned value)
{
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02X", value & 0xFF);
    return buf;
}

HatRegisterFile::HatRegisterFile(std::unique_ptr<I2cTransport> transport) : _transport(std::move(transport))
{
    if(!_transport)
        throw HatError(HatErrorKind::InvalidAccess, "transporte I2C nulo");
}

void HatRegisterFile::check_readable(const HatRegister& reg)
{
    if(!reg.readable())
        throw HatError(HatErrorKind::InvalidAccess, std::string("registrador somente escrita: ") + reg.name);
}

void HatRegisterFile::check_writable(const HatRegister& reg)
{
    if(!reg.writable())
        throw HatError(HatErrorKind::InvalidAccess, std::string("registrador somente leitura: ") + reg.name);
}

std::vector<uint8_t> HatRegisterFile::transfer(uint8_t command, const std::vector<uint8_t>& data,
                                               size_t response_size, bool acknowledged, const char* name)
{
    std::lock_guard<std::mutex> lock(_bus_mutex);

    HatFrame request;
    request.id = ++_frame_id;
    request.command = command;
    request.data = data;

    // Primeiro byte do quadro no campo "command" do bloco SMBus
    std::vector<uint8_t> raw = request.encode();
    _transport->write_block(raw[0], std::vector<uint8_t>(raw.begin() + 1, raw.end()));

    if(!acknowledged)
        return {};

    HatFrame response =
        HatFrame::decode(_transport->read_block(HAT_RESPONSE_DUMMY_BYTE, HatFrame::OVERHEAD + response_size));

    if(response.id != request.id)
    {
        throw HatError(HatErrorKind::TransferError, std::string(name) + ": id da resposta " + hex_byte(response.id) +
                                                        ", esperado " + hex_byte(request.id));
    }
    if(response.command != request.command)
    {
        throw HatError(HatErrorKind::TransferError, std::string(name) + ": comando da resposta " +
                                                        hex_byte(response.command) + ", esperado " +
                                                        hex_byte(request.command));
    }
    if(response.data.size() != response_size)
    {
        throw HatError(HatErrorKind::TransferError, std::string(name) + ": resposta com " +
                                                        std::to_string(response.data.size()) + " bytes, esperado " +
                                                        std::to_string(response_size));
    }
    return response.data;
}

std::vector<uint8_t> HatRegisterFile::read_payload(const HatRegister& reg)
{
    std::vector<uint8_t> data =
        transfer(reg.get_command, reg.selector, reg.selector.size() + reg.width, true, reg.name);

    // Placa repete o seletor (canal, tipo, registrador de IRQ) antes do valor
    if(!std::equal(reg.selector.begin(), reg.selector.end(), data.begin()))
        throw HatError(HatErrorKind::TransferError, std::string(reg.name) + ": seletor da resposta nao confere");

    return std::vector<uint8_t>(data.begin() + reg.selector.size(), data.end());
}

uint32_t HatRegisterFile::read(const HatRegister& reg)
{
    check_readable(reg);
    if(reg.width == 0 || reg.width > 4)
        throw HatError(HatErrorKind::InvalidAccess, std::string("registrador nao e um valor inteiro: ") + reg.name);

    std::vector<uint8_t> data = read_payload(reg);

    // little-endian
    uint32_t value = 0;
    for(size_t i = 0; i < data.size(); i++)
    {
        value |= static_cast<uint32_t>(data[i]) << (8 * i);
    }
    return value;
}

void HatRegisterFile::write(const HatRegister& reg, uint32_t value)
{
    check_writable(reg);
    if(reg.width > 4)
        throw HatError(HatErrorKind::InvalidAccess, std::string("registrador nao e um valor inteiro: ") + reg.name);

    if(value > max_value(reg.width))
    {
        throw HatError(HatErrorKind::OutOfRange,
                       std::string("valor ") + std::to_string(value) + " nao cabe em " + reg.name);
    }

    std::vector<uint8_t> data = reg.selector;
    for(size_t i = 0; i < reg.width; i++)
    {
        data.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }

    std::vector<uint8_t> echo = transfer(reg.set_command, data, data.size(), reg.acknowledged, reg.name);
    if(reg.acknowledged && echo != data)
        throw HatError(HatErrorKind::TransferError, std::string(reg.name) + ": eco da escrita nao confere");
}

std::vector<uint8_t> HatRegisterFile::read_block(const HatRegister& reg)
{
    check_readable(reg);
    return read_payload(reg);
}
