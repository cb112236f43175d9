// The one translation unit that compiles LodePNG (PNG encode, DEFLATE, CRC-32).
//
// CMake locates the upstream lodepng.cpp next to lodepng.h and adds its directory to the
// include path of this target only. Do not include "lodepng.cpp" from anywhere else.
#include "lodepng.cpp"
