#ifndef HAL_I2C_HPP
#define HAL_I2C_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

// Blocos SMBus de um unico escravo I2C (o primeiro byte vai no campo "command").
// Erros sao reportados com HatError (DeviceNotFound / TransferError), nunca repetidos aqui.
class I2cTransport
{
public:
    virtual ~I2cTransport() = default;

    virtual uint8_t address() const = 0;

    virtual std::vector<uint8_t> read_block(uint8_t command, size_t length) = 0;
    virtual void write_block(uint8_t command, const std::vector<uint8_t>& data) = 0;
};

// Implementacao Linux via /dev/i2c-N + libi2c (SMBus block read/write)
class HalI2C : public I2cTransport
{
public:
    static constexpr size_t MAX_BLOCK_SIZE = 32;

    HalI2C(const char* device_path, int slave_address);
    ~HalI2C() override;

    HalI2C(const HalI2C&) = delete;
    HalI2C& operator=(const HalI2C&) = delete;

    bool is_valid() const;

    uint8_t address() const override { return _address; }

    std::vector<uint8_t> read_block(uint8_t command, size_t length) override;
    void write_block(uint8_t command, const std::vector<uint8_t>& data) override;

private:
    int _fd{-1};
    uint8_t _address;
    std::string _device_path;

    [[noreturn]] void fail(int error_number, const char* operation, uint8_t command) const;
};

#endif
