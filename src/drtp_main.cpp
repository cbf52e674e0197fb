#include "DrtpClient.h"
#include "DrtpConfig.h"
#include "DrtpServer.h"

int main(int argc, char** argv) {
    DrtpConfig args;
    if (!parse_args(argc, argv, args)) return 1;

    if (args.role == Role::Server) {
        DrtpServer s(args);
        if (!s.init()) return 2;
        if (!s.run()) return 3;
        return 0;
    }

    DrtpClient c(args);
    if (!c.init()) return 2;
    if (!c.run()) return 3;
    return 0;
}
