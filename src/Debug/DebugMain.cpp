#include "DebugTests.hpp"

int main() {
	runDebugTests();
	return 0;
}
