/*
 * app_hal_gpio.cpp
 *
 *  Created on: Oct 19, 2026
 *      Author: pinflash developers
 */

#include "app_hal_gpio.hpp"
#include "app_debug_if.hpp"

#include <cerrno>
#include <cstring>

extern "C" {
	#include <fcntl.h>
	#include <unistd.h>
	#include <sys/ioctl.h>
	#include <linux/gpio.h> //character device uAPI
}

//========================================= CONSTRUCTOR ==========================================

GPIO::GPIO(const GPIO::GPIO_Hardware_Pin& _pin):
	pin(_pin)
{}

GPIO::~GPIO() {
	deinit();
}

//========================================= INIT FUNCTIONS ==========================================

GPIO::GPIO_STATUS GPIO::init() {
	//already holding the line, nothing to do
	if(line_fd >= 0) return GPIO_STATUS::GPIO_OK;

	int chip_fd = ::open(pin._CHIP_PATH.c_str(), O_RDWR | O_CLOEXEC);
	if(chip_fd < 0) {
		Debug::ERROR(label() + ": cannot open chip (" + std::strerror(errno) + ")");
		return GPIO_STATUS::GPIO_UNAVAILABLE;
	}

	//check who owns the line and how it's configured before we touch it
	gpio_v2_line_info info;
	std::memset(&info, 0, sizeof(info));
	info.offset = pin._LINE_OFFSET;
	if(::ioctl(chip_fd, GPIO_V2_GET_LINEINFO_IOCTL, &info) < 0) {
		//EINVAL here means the offset doesn't exist on this chip
		Debug::ERROR(label() + ": cannot query line (" + std::strerror(errno) + ")");
		::close(chip_fd);
		return GPIO_STATUS::GPIO_UNAVAILABLE;
	}

	if(info.flags & GPIO_V2_LINE_FLAG_USED) {
		std::string owner = info.consumer[0] ? std::string(info.consumer) : std::string("kernel");
		Debug::ERROR(label() + ": line already in use by \"" + owner + "\"");
		::close(chip_fd);
		return GPIO_STATUS::GPIO_UNAVAILABLE;
	}

	//remember the direction and bias so they can be restored when we let go
	initial.mode = (info.flags & GPIO_V2_LINE_FLAG_OUTPUT) ? Mode::OUTPUT : Mode::INPUT;
	if(info.flags & GPIO_V2_LINE_FLAG_BIAS_PULL_UP) initial.pull = Pull::PULL_UP;
	else if(info.flags & GPIO_V2_LINE_FLAG_BIAS_PULL_DOWN) initial.pull = Pull::PULL_DOWN;
	else initial.pull = Pull::NONE;

	//claim the line with no direction flags so the kernel leaves it as-is
	//(bias flags need a direction, so those stay off too; the bias isn't touched either way)
	gpio_v2_line_request request;
	std::memset(&request, 0, sizeof(request));
	request.offsets[0] = pin._LINE_OFFSET;
	request.num_lines = 1;
	std::strncpy(request.consumer, pin._CONSUMER.c_str(), GPIO_MAX_NAME_SIZE - 1);
	request.config.flags = 0;

	if(::ioctl(chip_fd, GPIO_V2_GET_LINE_IOCTL, &request) < 0) {
		//EBUSY if someone beat us to it between the two ioctls
		Debug::ERROR(label() + ": cannot claim line (" + std::strerror(errno) + ")");
		::close(chip_fd);
		return GPIO_STATUS::GPIO_UNAVAILABLE;
	}

	//the line fd stays valid on its own, don't need the chip anymore
	::close(chip_fd);
	line_fd = request.fd;

	//sample the level before anything gets reconfigured--an output keeps reading back what it drives
	initial.level = read();

	//and only then put the line in a known state: input, bias as it was
	if(configure({Mode::INPUT, Level::LOW, initial.pull}) != GPIO_STATUS::GPIO_OK) {
		deinit();
		return GPIO_STATUS::GPIO_UNAVAILABLE;
	}
	return GPIO_STATUS::GPIO_OK;
}

void GPIO::deinit() {
	if(line_fd < 0) return;
	::close(line_fd);
	line_fd = -1;
}

//========================================= LINE CONTROL ==========================================

GPIO::Line_State GPIO::initial_state() const {
	return initial;
}

GPIO::GPIO_STATUS GPIO::configure(const Line_State& state) {
	if(line_fd < 0) return GPIO_STATUS::GPIO_ERROR;

	gpio_v2_line_config config;
	std::memset(&config, 0, sizeof(config));
	config.flags = line_flags(state);

	//for outputs, hand the kernel the output value along with the direction
	//this way the line never glitches to the wrong level on the switch
	if(state.mode == Mode::OUTPUT) {
		config.num_attrs = 1;
		config.attrs[0].attr.id = GPIO_V2_LINE_ATTR_ID_OUTPUT_VALUES;
		config.attrs[0].attr.values = (state.level == Level::HIGH) ? 1 : 0;
		config.attrs[0].mask = 1;
	}

	if(::ioctl(line_fd, GPIO_V2_LINE_SET_CONFIG_IOCTL, &config) < 0) {
		Debug::ERROR(label() + ": cannot configure line (" + std::strerror(errno) + ")");
		return GPIO_STATUS::GPIO_ERROR;
	}
	return GPIO_STATUS::GPIO_OK;
}

GPIO::Level GPIO::read() {
	if(line_fd < 0) return Level::LOW;

	gpio_v2_line_values values;
	std::memset(&values, 0, sizeof(values));
	values.mask = 1;
	if(::ioctl(line_fd, GPIO_V2_LINE_GET_VALUES_IOCTL, &values) < 0) {
		Debug::WARN(label() + ": cannot read line (" + std::strerror(errno) + ")");
		return Level::LOW;
	}
	return (values.bits & 1) ? Level::HIGH : Level::LOW;
}

std::string GPIO::label() const {
	return pin._CHIP_PATH + ":" + std::to_string(pin._LINE_OFFSET);
}

//###### static methods ######

uint64_t GPIO::line_flags(const Line_State& state) {
	uint64_t flags = (state.mode == Mode::OUTPUT) ? GPIO_V2_LINE_FLAG_OUTPUT : GPIO_V2_LINE_FLAG_INPUT;
	switch(state.pull) {
		case Pull::PULL_UP:		flags |= GPIO_V2_LINE_FLAG_BIAS_PULL_UP; break;
		case Pull::PULL_DOWN:	flags |= GPIO_V2_LINE_FLAG_BIAS_PULL_DOWN; break;
		case Pull::NONE:		break;
	}
	return flags;
}
