#include "hal_gpio.hpp"
#include "hat_error.hpp"

static constexpr size_t EVENT_BUFFER_SIZE = 16;

static gpiod_line_edge to_gpiod(HalGpio::Edge edge)
{
    switch(edge)
    {
    case HalGpio::Edge::Rising:
        return GPIOD_LINE_EDGE_RISING;
    case HalGpio::Edge::Falling:
        return GPIOD_LINE_EDGE_FALLING;
    case HalGpio::Edge::Both:
        return GPIOD_LINE_EDGE_BOTH;
    default:
        return GPIOD_LINE_EDGE_NONE;
    }
}

static gpiod_line_bias to_gpiod(HalGpio::Bias bias)
{
    switch(bias)
    {
    case HalGpio::Bias::PullUp:
        return GPIOD_LINE_BIAS_PULL_UP;
    case HalGpio::Bias::PullDown:
        return GPIOD_LINE_BIAS_PULL_DOWN;
    default:
        return GPIOD_LINE_BIAS_AS_IS;
    }
}

HalGpio::HalGpio(unsigned int pin, Edge edge, Bias bias, bool active_low, const char* chip_name)
    : _pin(pin), _chip_path(chip_name)
{
    _chip = gpiod_chip_open(_chip_path.c_str());
    if(!_chip)
        throw HatError(HatErrorKind::DeviceNotFound, "HAL GPIO: falha ao abrir " + _chip_path);

    struct gpiod_line_settings* settings = gpiod_line_settings_new();
    gpiod_line_settings_set_direction(settings, GPIOD_LINE_DIRECTION_INPUT);
    gpiod_line_settings_set_active_low(settings, active_low);
    gpiod_line_settings_set_bias(settings, to_gpiod(bias));
    gpiod_line_settings_set_edge_detection(settings, to_gpiod(edge));

    struct gpiod_line_config* line_cfg = gpiod_line_config_new();
    gpiod_line_config_add_line_settings(line_cfg, &_pin, 1, settings);

    struct gpiod_request_config* req_cfg = gpiod_request_config_new();
    gpiod_request_config_set_consumer(req_cfg, "i2c-hats-irq");

    _req = gpiod_chip_request_lines(_chip, req_cfg, line_cfg);

    gpiod_line_settings_free(settings);
    gpiod_line_config_free(line_cfg);
    gpiod_request_config_free(req_cfg);

    if(!_req)
    {
        gpiod_chip_close(_chip);
        throw HatError(HatErrorKind::DeviceNotFound,
                       "HAL GPIO: falha ao requisitar linha " + std::to_string(_pin) + " em " + _chip_path);
    }

    if(edge != Edge::None)
    {
        _buffer = gpiod_edge_event_buffer_new(EVENT_BUFFER_SIZE);
        if(!_buffer)
        {
            gpiod_line_request_release(_req);
            gpiod_chip_close(_chip);
            throw HatError(HatErrorKind::DeviceNotFound,
                           "HAL GPIO: falha ao alocar buffer de eventos da linha " + std::to_string(_pin));
        }
    }
}

HalGpio::~HalGpio()
{
    if(_buffer)
        gpiod_edge_event_buffer_free(_buffer);
    gpiod_line_request_release(_req);
    gpiod_chip_close(_chip);
}

bool HalGpio::get() const
{
    return gpiod_line_request_get_value(_req, _pin) == GPIOD_LINE_VALUE_ACTIVE;
}

HalGpio::Edge HalGpio::wait_for_edge(int64_t timeout_ns)
{
    if(!_buffer)
        throw HatError(HatErrorKind::InvalidAccess,
                       "HAL GPIO: linha " + std::to_string(_pin) + " sem deteccao de borda");

    int ret = gpiod_line_request_wait_edge_events(_req, timeout_ns);
    if(ret < 0)
        throw HatError(HatErrorKind::TransferError, "HAL GPIO: falha ao esperar borda na linha " + std::to_string(_pin));
    if(ret == 0)
        return Edge::None;

    // Rajadas de bordas viram um unico despertar; vale a ultima
    int count = gpiod_line_request_read_edge_events(_req, _buffer, EVENT_BUFFER_SIZE);
    if(count < 0)
        throw HatError(HatErrorKind::TransferError, "HAL GPIO: falha ao ler bordas da linha " + std::to_string(_pin));
    if(count == 0)
        return Edge::None;

    struct gpiod_edge_event* event = gpiod_edge_event_buffer_get_event(_buffer, count - 1);
    return gpiod_edge_event_get_event_type(event) == GPIOD_EDGE_EVENT_RISING_EDGE ? Edge::Rising : Edge::Falling;
}
