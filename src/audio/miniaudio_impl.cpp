// Single translation unit holding the miniaudio implementation
#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>
