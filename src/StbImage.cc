// Single translation unit that compiles the stb_image decoder.
#define STB_IMAGE_IMPLEMENTATION
#include <stb/stb_image.h>
