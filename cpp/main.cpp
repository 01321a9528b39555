#include "server/main.hpp"

KJ_MAIN(server::Main);
