#include "hat_registers.hpp"
#include "hat_error.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

static std::string to_lower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

static std::string hex_byte(unsigned value)
{
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02X", value & 0xFF);
    return buf;
}

/* ================= ChannelMap ================= */

ChannelMap::ChannelMap(std::vector<std::string> labels) : _labels(std::move(labels))
{
    for(const auto& label : _labels)
    {
        _lower_labels.push_back(to_lower(label));
    }
}

uint32_t ChannelMap::mask() const
{
    if(_labels.size() >= 32)
        return 0xFFFFFFFFu;
    return (1u << _labels.size()) - 1u;
}

size_t ChannelMap::index_of(const std::string& label) const
{
    auto it = std::find(_lower_labels.begin(), _lower_labels.end(), to_lower(label));
    if(it == _lower_labels.end())
    {
        throw HatError(HatErrorKind::InvalidAccess, "'" + label + "' nao e um rotulo de canal valido");
    }
    return static_cast<size_t>(it - _lower_labels.begin());
}

const std::string& ChannelMap::label_of(size_t index) const
{
    return _labels[validate(index)];
}

size_t ChannelMap::validate(size_t index) const
{
    if(index >= _labels.size())
    {
        throw HatError(HatErrorKind::InvalidAccess, "'" + std::to_string(index) + "' nao e um indice de canal valido");
    }
    return index;
}

/* ================= Tipos de placa ================= */

static std::vector<std::string> numbered(const char* prefix, int first, int count)
{
    std::vector<std::string> labels;
    for(int i = 0; i < count; i++)
    {
        labels.push_back(prefix + std::to_string(first + i));
    }
    return labels;
}

// Di1.1 .. DiB.C (blocos de canais da Di16 / Di6Rly6)
static std::vector<std::string> blocks(int block_count, int per_block)
{
    std::vector<std::string> labels;
    for(int b = 1; b <= block_count; b++)
    {
        for(int c = 1; c <= per_block; c++)
        {
            labels.push_back("Di" + std::to_string(b) + "." + std::to_string(c));
        }
    }
    return labels;
}

const std::vector<HatBoardType>& hat_board_types()
{
    static const std::vector<HatBoardType> types = {
        {HatModel::Di16, "Di16", "Di16 I2C-HAT", 0x40, ChannelMap(blocks(4, 4)), ChannelMap(), false},
        {HatModel::Rly10, "Rly10", "Rly10 I2C-HAT", 0x50, ChannelMap(), ChannelMap(numbered("Rly", 1, 10)), false},
        {HatModel::Di6Rly6, "Di6Rly6", "Di6Rly6 I2C-HAT", 0x60, ChannelMap(blocks(1, 6)),
         ChannelMap(numbered("Rly", 1, 6)), false},
        {HatModel::DI16ac, "DI16ac", "DI16ac I2C-HAT", 0x40, ChannelMap(numbered("I", 0, 16)), ChannelMap(), true},
        {HatModel::DQ16oc, "DQ16oc", "DQ16oc I2C-HAT", 0x50, ChannelMap(), ChannelMap(numbered("Q", 0, 16)), false},
        {HatModel::DQ10rly, "DQ10rly", "DQ10rly I2C-HAT", 0x50, ChannelMap(), ChannelMap(numbered("Q", 0, 10)), false},
        {HatModel::DQ8rly, "DQ8rly", "DQ8rly I2C-HAT", 0x50, ChannelMap(), ChannelMap(numbered("Q", 0, 8)), false},
        {HatModel::DI6acDQ6rly, "DI6acDQ6rly", "DI6acDQ6rly I2C-HAT", 0x60, ChannelMap(numbered("I", 0, 6)),
         ChannelMap(numbered("Q", 0, 6)), true},
        {HatModel::DI6acDQ6ssr, "DI6acDQ6ssr", "DI6acDQ6ssr I2C-HAT", 0x70, ChannelMap(numbered("I", 0, 6)),
         ChannelMap(numbered("Q", 0, 6)), true},
        {HatModel::DI6dwDQ6ssr, "DI6dwDQ6ssr", "DI6dwDQ6ssr I2C-HAT", 0x60, ChannelMap(numbered("I", 0, 6)),
         ChannelMap(numbered("Q", 0, 6)), true},
    };
    return types;
}

const HatBoardType& hat_board_type(HatModel model)
{
    for(const auto& type : hat_board_types())
    {
        if(type.model == model)
            return type;
    }
    throw HatError(HatErrorKind::OutOfRange, "modelo de placa desconhecido");
}

const HatBoardType& find_board_type(const std::string& name)
{
    std::string wanted = to_lower(name);
    for(const auto& type : hat_board_types())
    {
        if(to_lower(type.short_name) == wanted || to_lower(type.name) == wanted)
            return type;
    }
    throw HatError(HatErrorKind::OutOfRange, "tipo de placa desconhecido: '" + name + "'");
}

bool HatBoardType::accepts_address(int address) const
{
    return address >= 0 && address <= 0x7F && (address & 0xF0) == base_address;
}

void validate_address(const HatBoardType& type, int address)
{
    if(!type.accepts_address(address))
    {
        throw HatError(HatErrorKind::OutOfRange, std::string(type.short_name) + ": endereco " + hex_byte(address) +
                                                     " fora de [" + hex_byte(type.base_address) + ", " +
                                                     hex_byte(type.base_address + 0x0F) + "]");
    }
}

uint8_t address_from_jumper(const HatBoardType& type, unsigned jumper)
{
    if(jumper > 0x0F)
    {
        throw HatError(HatErrorKind::OutOfRange, "jumper de endereco fora de [0x0, 0xF]: " + std::to_string(jumper));
    }
    return static_cast<uint8_t>(type.base_address | jumper);
}

/* ================= HatRegisterMap ================= */

// Mesma ordem de HatField
static const HatRegister k_registers[] = {
    {HAT_CMD_GET_BOARD_NAME, HAT_CMD_NONE, HAT_BOARD_NAME_SIZE, "board_name"},
    {HAT_CMD_GET_FIRMWARE_VERSION, HAT_CMD_NONE, HAT_FIRMWARE_VERSION_SIZE, "firmware_version"},
    {HAT_CMD_GET_STATUS_WORD, HAT_CMD_NONE, 4, "status"},
    {HAT_CMD_NONE, HAT_CMD_RESET, 0, "reset", {}, false},
    {HAT_CMD_CWDT_GET_PERIOD, HAT_CMD_CWDT_SET_PERIOD, 4, "cwdt_period"},
    {HAT_CMD_DI_GET_ALL_CHANNELS, HAT_CMD_NONE, 4, "di_value"},
    {HAT_CMD_NONE, HAT_CMD_DI_RESET_ALL_COUNTERS, 0, "di_reset_counters"},
    {HAT_CMD_DQ_GET_POWER_ON_VALUE, HAT_CMD_DQ_SET_POWER_ON_VALUE, 4, "dq_power_on_value"},
    {HAT_CMD_DQ_GET_SAFETY_VALUE, HAT_CMD_DQ_SET_SAFETY_VALUE, 4, "dq_safety_value"},
    {HAT_CMD_DQ_GET_ALL_CHANNELS, HAT_CMD_DQ_SET_ALL_CHANNELS, 4, "dq_value"},
    {HAT_CMD_IRQ_GET_REG, HAT_CMD_IRQ_SET_REG, 4, "irq_rising_edge_control", {HAT_IRQ_REG_RISING_EDGE_CONTROL}},
    {HAT_CMD_IRQ_GET_REG, HAT_CMD_IRQ_SET_REG, 4, "irq_falling_edge_control", {HAT_IRQ_REG_FALLING_EDGE_CONTROL}},
    {HAT_CMD_IRQ_GET_REG, HAT_CMD_IRQ_SET_REG, 4, "irq_capture", {HAT_IRQ_REG_CAPTURE}},
};

HatRegisterMap::HatRegisterMap(const HatBoardType& type) : _type(type) {}

void HatRegisterMap::require_di() const
{
    if(!has_di())
        throw HatError(HatErrorKind::InvalidAccess, std::string(_type.short_name) + " nao tem entradas digitais");
}

void HatRegisterMap::require_dq() const
{
    if(!has_dq())
        throw HatError(HatErrorKind::InvalidAccess, std::string(_type.short_name) + " nao tem saidas digitais");
}

const HatRegister& HatRegisterMap::reg(HatField field) const
{
    switch(field)
    {
    case HatField::DiValue:
    case HatField::DiResetCounters:
        require_di();
        break;
    case HatField::DqPowerOnValue:
    case HatField::DqSafetyValue:
    case HatField::DqValue:
        require_dq();
        break;
    case HatField::IrqRisingEdgeControl:
    case HatField::IrqFallingEdgeControl:
    case HatField::IrqCapture:
        if(!has_irq())
            throw HatError(HatErrorKind::InvalidAccess, std::string(_type.short_name) + " nao tem IRQ");
        break;
    default:
        break;
    }
    return k_registers[static_cast<size_t>(field)];
}

HatRegister HatRegisterMap::di_channel(size_t channel) const
{
    require_di();
    _type.di.validate(channel);
    return {HAT_CMD_DI_GET_CHANNEL, HAT_CMD_NONE, 1, "di_channel", {static_cast<uint8_t>(channel)}};
}

HatRegister HatRegisterMap::dq_channel(size_t channel) const
{
    require_dq();
    _type.dq.validate(channel);
    return {HAT_CMD_DQ_GET_CHANNEL, HAT_CMD_DQ_SET_CHANNEL, 1, "dq_channel", {static_cast<uint8_t>(channel)}};
}

HatRegister HatRegisterMap::counter(HatEdge edge, size_t channel) const
{
    require_di();
    _type.di.validate(channel);
    return {HAT_CMD_DI_GET_COUNTER, HAT_CMD_NONE, 4,
            edge == HatEdge::Rising ? "di_rising_counter" : "di_falling_counter",
            {static_cast<uint8_t>(channel), static_cast<uint8_t>(edge)}};
}

HatRegister HatRegisterMap::counter_reset(HatEdge edge, size_t channel) const
{
    require_di();
    _type.di.validate(channel);
    return {HAT_CMD_NONE, HAT_CMD_DI_RESET_COUNTER, 0,
            edge == HatEdge::Rising ? "di_rising_counter" : "di_falling_counter",
            {static_cast<uint8_t>(channel), static_cast<uint8_t>(edge)}};
}
