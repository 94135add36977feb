#include "app/DaemonMain.hpp"

int main(int argc, char *argv[])
{
    return kc::app::daemon_main(argc, argv);
}
