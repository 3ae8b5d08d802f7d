#pragma once

#ifndef WORDCHEF_VERSION_STRING
#define WORDCHEF_VERSION_STRING "0.1.0"
#endif
