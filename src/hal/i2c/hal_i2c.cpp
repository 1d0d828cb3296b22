#include "hal_i2c.hpp"
#include "hat_error.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <linux/i2c-dev.h>
extern "C"
{
#include <i2c/smbus.h>
}
#include <cerrno>
#include <cstdio>
#include <cstring>

static std::string hex_byte(unsigned value)
{
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02X", value & 0xFF);
    return buf;
}

HalI2C::HalI2C(const char* device_path, int slave_address)
    : _address(static_cast<uint8_t>(slave_address)), _device_path(device_path)
{
    if(slave_address < 0 || slave_address > 0x7F)
    {
        throw HatError(HatErrorKind::OutOfRange, "endereco I2C fora de [0x00, 0x7F]: " + std::to_string(slave_address));
    }

    _fd = ::open(device_path, O_RDWR);
    if(_fd < 0)
    {
        int err = errno;
        throw HatError(HatErrorKind::DeviceNotFound,
                       "falha ao abrir " + _device_path + ": " + std::strerror(err));
    }

    if(ioctl(_fd, I2C_SLAVE, slave_address) < 0)
    {
        int err = errno;
        ::close(_fd);
        _fd = -1;
        throw HatError(HatErrorKind::DeviceNotFound,
                       "falha ao configurar endereco do escravo " + hex_byte(_address) + ": " + std::strerror(err));
    }
}

HalI2C::~HalI2C()
{
    if(_fd >= 0)
    {
        ::close(_fd);
    }
}

bool HalI2C::is_valid() const
{
    return _fd >= 0;
}

void HalI2C::fail(int error_number, const char* operation, uint8_t command) const
{
    std::string msg = std::string(operation) + " cmd " + hex_byte(command) + " em " + _device_path + " adr " +
                      hex_byte(_address) + ": " + std::strerror(error_number);

    // ENXIO/ENODEV: ninguem respondeu no endereco
    if(error_number == ENXIO || error_number == ENODEV)
        throw HatError(HatErrorKind::DeviceNotFound, msg);

    throw HatError(HatErrorKind::TransferError, msg);
}

std::vector<uint8_t> HalI2C::read_block(uint8_t command, size_t length)
{
    if(!is_valid())
        throw HatError(HatErrorKind::DeviceNotFound, "barramento fechado: " + _device_path);

    if(length == 0 || length > MAX_BLOCK_SIZE)
        throw HatError(HatErrorKind::OutOfRange, "tamanho de bloco invalido: " + std::to_string(length));

    std::vector<uint8_t> data(length);
    int ret = i2c_smbus_read_i2c_block_data(_fd, command, static_cast<uint8_t>(length), data.data());
    if(ret < 0)
        fail(-ret, "leitura", command);

    if(static_cast<size_t>(ret) != length)
    {
        throw HatError(HatErrorKind::TransferError, "leitura curta cmd " + hex_byte(command) + ": " +
                                                        std::to_string(ret) + " de " + std::to_string(length) + " bytes");
    }

    return data;
}

void HalI2C::write_block(uint8_t command, const std::vector<uint8_t>& data)
{
    if(!is_valid())
        throw HatError(HatErrorKind::DeviceNotFound, "barramento fechado: " + _device_path);

    if(data.empty() || data.size() > MAX_BLOCK_SIZE)
        throw HatError(HatErrorKind::OutOfRange, "tamanho de bloco invalido: " + std::to_string(data.size()));

    int ret = i2c_smbus_write_i2c_block_data(_fd, command, static_cast<uint8_t>(data.size()), data.data());
    if(ret < 0)
        fail(-ret, "escrita", command);
}
