#include "pathkit/cli.hpp"

int main(int argc, char* argv[])
{
	return pathkit::cli::run(argc, argv);
}
