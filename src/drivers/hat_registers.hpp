#ifndef HAT_REGISTERS_HPP
#define HAT_REGISTERS_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/* Comandos das I2C-HATs (campo "comando" do quadro, ver hat_frame.hpp).
 * Valores de 32 bits sao little-endian. Comandos "set" respondem com eco dos dados. */
#define HAT_CMD_NONE                    0x00
#define HAT_CMD_GET_BOARD_NAME          0x10 // -> 25 bytes, ASCII terminado em 0
#define HAT_CMD_GET_FIRMWARE_VERSION    0x11 // -> major, minor, patch
#define HAT_CMD_GET_STATUS_WORD         0x12
#define HAT_CMD_RESET                   0x13 // sem resposta
#define HAT_CMD_CWDT_SET_PERIOD         0x14 // ms, 0 = CWDT desabilitado
#define HAT_CMD_CWDT_GET_PERIOD         0x15
#define HAT_CMD_CWDT_SET_STATE          0x16
#define HAT_CMD_DI_GET_ALL_CHANNELS     0x20
#define HAT_CMD_DI_GET_CHANNEL          0x21 // [canal] -> [canal, estado]
#define HAT_CMD_DI_GET_COUNTER          0x22 // [canal, tipo] -> [canal, tipo, u32]
#define HAT_CMD_DI_RESET_COUNTER        0x23 // [canal, tipo] -> eco
#define HAT_CMD_DI_RESET_ALL_COUNTERS   0x24 // -> vazio
#define HAT_CMD_DQ_SET_POWER_ON_VALUE   0x30
#define HAT_CMD_DQ_GET_POWER_ON_VALUE   0x31
#define HAT_CMD_DQ_SET_SAFETY_VALUE     0x32 // aplicado no timeout do CWDT
#define HAT_CMD_DQ_GET_SAFETY_VALUE     0x33
#define HAT_CMD_DQ_SET_ALL_CHANNELS     0x34
#define HAT_CMD_DQ_GET_ALL_CHANNELS     0x35
#define HAT_CMD_DQ_SET_CHANNEL          0x36 // [canal, estado] -> eco
#define HAT_CMD_DQ_GET_CHANNEL          0x37 // [canal] -> [canal, estado]
#define HAT_CMD_IRQ_SET_REG             0x40 // [reg, u32] -> eco
#define HAT_CMD_IRQ_GET_REG             0x41 // [reg] -> [reg, u32]

/* Registradores de IRQ (primeiro byte de dados de IRQ_SET_REG / IRQ_GET_REG) */
#define HAT_IRQ_REG_RISING_EDGE_CONTROL  0x00
#define HAT_IRQ_REG_FALLING_EDGE_CONTROL 0x01
#define HAT_IRQ_REG_CAPTURE              0x02 // leitura desenfileira, escrita de 0 limpa

/* Leitura da resposta: read_i2c_block_data manda este byte antes, a placa o ignora */
#define HAT_RESPONSE_DUMMY_BYTE 0xFF

#define HAT_BOARD_NAME_SIZE       25
#define HAT_FIRMWARE_VERSION_SIZE 3

/* Status word */
#define HAT_STATUS_CWDT_TIMEOUT (1u << 0)
#define HAT_STATUS_COMM_ERROR   (1u << 1)
#define HAT_STATUS_IRQ_OVERFLOW (1u << 2)

// Um valor da placa: comando de leitura e/ou escrita, seletor e largura
struct HatRegister
{
    uint8_t get_command; // HAT_CMD_NONE: somente escrita
    uint8_t set_command; // HAT_CMD_NONE: somente leitura
    uint8_t width;       // bytes do valor, depois do seletor
    const char* name;
    std::vector<uint8_t> selector{}; // prefixo dos dados, ecoado pela placa (canal, tipo, reg de IRQ)
    bool acknowledged{true};         // false: a placa nao responde (reset)

    bool readable() const { return get_command != HAT_CMD_NONE; }
    bool writable() const { return set_command != HAT_CMD_NONE; }
};

enum class HatField
{
    BoardName,
    FirmwareVersion,
    StatusWord,
    Reset,
    CwdtPeriod,
    DiValue,
    DiResetCounters,
    DqPowerOnValue,
    DqSafetyValue,
    DqValue,
    IrqRisingEdgeControl,
    IrqFallingEdgeControl,
    IrqCapture
};

// Tipo de contador de borda (mesma numeracao do firmware: 0 - descida, 1 - subida)
enum class HatEdge : uint8_t
{
    Falling = 0,
    Rising = 1
};

// Rotulos de canais: indice <-> rotulo, busca por rotulo sem diferenciar maiusculas
class ChannelMap
{
public:
    ChannelMap() = default;
    explicit ChannelMap(std::vector<std::string> labels);

    size_t count() const { return _labels.size(); }
    bool empty() const { return _labels.empty(); }
    const std::vector<std::string>& labels() const { return _labels; }

    // Todos os canais em um bitmap
    uint32_t mask() const;

    size_t index_of(const std::string& label) const;
    const std::string& label_of(size_t index) const;
    size_t validate(size_t index) const;

private:
    std::vector<std::string> _labels;
    std::vector<std::string> _lower_labels;
};

enum class HatModel
{
    Di16,
    Rly10,
    Di6Rly6,
    DI16ac,
    DQ16oc,
    DQ10rly,
    DQ8rly,
    DI6acDQ6rly,
    DI6acDQ6ssr,
    DI6dwDQ6ssr
};

struct HatBoardType
{
    HatModel model;
    const char* short_name; // "DI16ac"
    const char* name;       // nome gravado na placa: "DI16ac I2C-HAT"
    uint8_t base_address;   // nibble alto fixo, nibble baixo via jumpers
    ChannelMap di;
    ChannelMap dq;
    bool has_irq;

    bool accepts_address(int address) const;
};

const HatBoardType& hat_board_type(HatModel model);
const HatBoardType& find_board_type(const std::string& name);
const std::vector<HatBoardType>& hat_board_types();

// Endereco completo a partir dos jumpers (0x0..0xF)
uint8_t address_from_jumper(const HatBoardType& type, unsigned jumper);
void validate_address(const HatBoardType& type, int address);

// Registradores de um tipo de placa; grupos ausentes geram InvalidAccess
class HatRegisterMap
{
public:
    explicit HatRegisterMap(const HatBoardType& type);

    const HatBoardType& type() const { return _type; }

    const HatRegister& reg(HatField field) const;

    // Registradores por canal (seletor = canal, tipo do contador)
    HatRegister di_channel(size_t channel) const;
    HatRegister dq_channel(size_t channel) const;
    HatRegister counter(HatEdge edge, size_t channel) const;
    HatRegister counter_reset(HatEdge edge, size_t channel) const;

    const ChannelMap& di_channels() const { return _type.di; }
    const ChannelMap& dq_channels() const { return _type.dq; }

    bool has_di() const { return !_type.di.empty(); }
    bool has_dq() const { return !_type.dq.empty(); }
    bool has_irq() const { return _type.has_irq; }

private:
    const HatBoardType& _type;

    void require_di() const;
    void require_dq() const;
};

#endif
