#pragma once

// Overridden by the build
#ifndef LEDGERCHAT_VERSION
#define LEDGERCHAT_VERSION "0.1.0"
#endif
