#pragma once

#include <cstdint>
#include <string>

//================================ ABSTRACT GPIO LINE ================================
/*
 * Anything that owns a single GPIO line on the host
 * The sequencer only talks to lines through this interface; the character device
 * implementation lives below, and tests substitute recording lines
 */

class GPIO_Interface {
public:
	//status enums to report back to calling code
	enum class GPIO_STATUS {
		GPIO_OK,
		GPIO_UNAVAILABLE,	//line busy, missing, or no permission to claim it
		GPIO_ERROR			//line claimed but the kernel rejected an operation
	};

	enum class Mode { INPUT, OUTPUT };
	enum class Level { LOW, HIGH };
	enum class Pull { NONE, PULL_UP, PULL_DOWN };

	struct Line_State {
		Mode mode;
		Level level;
		Pull pull;
	};

	//claim the line exclusively and record its state; leaves it as an input with its bias untouched
	virtual GPIO_STATUS init() = 0;

	//give up the claim; safe to call when not claimed
	virtual void deinit() = 0;

	//state of the line right before `init()` claimed it
	virtual Line_State initial_state() const = 0;

	//reconfigure direction/level/bias in one shot
	//for outputs the level is applied together with the direction change
	virtual GPIO_STATUS configure(const Line_State& state) = 0;

	virtual Level read() = 0;

	//human readable identifier for debug messages
	virtual std::string label() const = 0;

	virtual ~GPIO_Interface() = default;
};

//================================ LINUX CHARACTER DEVICE GPIO ================================
/*
 * One line on a `/dev/gpiochipN` device, driven through the v2 character device uAPI
 * The kernel only hands a line to one requester at a time, so a successful `init()` is an exclusive claim
 * Closing the line fd (in `deinit()` or the destructor) gives the line back
 */

class GPIO : public GPIO_Interface {
public:
	//================================ HARDWARE REFERENCES TO EACH GPIO LINE ================================

	struct GPIO_Hardware_Pin {
		std::string _CHIP_PATH;		//i.e. /dev/gpiochip0
		uint32_t _LINE_OFFSET;		//line number on that chip (BCM number on a Raspberry Pi)
		std::string _CONSUMER;		//label the kernel shows for the claimed line
	};

	//================================= INSTANCE METHODS ===================================
	GPIO_STATUS init() override;
	void deinit() override;
	Line_State initial_state() const override;
	GPIO_STATUS configure(const Line_State& state) override;
	Level read() override;
	std::string label() const override;

	bool is_claimed() const { return line_fd >= 0; }

	//========================= CONSTRUCTORS, DESTRUCTORS, OVERLOADS =========================
	GPIO(const GPIO_Hardware_Pin& _pin);
	~GPIO() override;

	//delete assignment operator and copy constructor
	//in order to prevent hardware conflicts
	GPIO(GPIO const& other) = delete;
	void operator=(GPIO const& other) = delete;

private:
	static uint64_t line_flags(const Line_State& state);

	const GPIO_Hardware_Pin pin;

	int line_fd = -1;	//file descriptor of the claimed line; -1 while unclaimed
	Line_State initial = {Mode::INPUT, Level::LOW, Pull::NONE};
};
