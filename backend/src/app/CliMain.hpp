#pragma once

namespace tp::app
{

// Runs the settings command line front end. Loads the global config and the
// startup preset, executes one command and waits for pending saves.
int cli_main(int argc, char *argv[]);

} // namespace tp::app
