#pragma once

namespace kc::app
{

// Runs the kidcached daemon: connects to the configured server, then keeps
// the catalog and the offline cache current until SIGINT/SIGTERM.
int daemon_main(int argc, char *argv[]);

} // namespace kc::app
