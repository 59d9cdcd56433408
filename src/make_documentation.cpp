#include "documentation.hpp"
#include "report.hpp"

int main() {
	documentation::Documentation doc;
	std::cout << doc();
	return 0;
}
