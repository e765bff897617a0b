#include "app_main.hpp"

int main(int argc, char* argv[]) {
	return app_main(std::span<char* const>(argv, static_cast<size_t>(argc)));
}
