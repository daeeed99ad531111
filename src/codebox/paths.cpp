#include <codebox/paths.h>

fs::path kBoxRoot = "/tmp/codebox";
