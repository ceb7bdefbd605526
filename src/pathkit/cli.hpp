#pragma once

namespace pathkit::cli
{
	// Entry point of the pathkit tool. Returns the process exit code.
	int run(int argc, char *argv[]);
} // namespace pathkit::cli
