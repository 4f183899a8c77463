#include "Native/MTTypes.hpp"

#include <iostream>

using namespace std;

ostream& operator << (ostream& out, const StreamingMode& Mode)
{
	out << FrameTypeNames.at(Mode.Frame) << "/" << DecimationNames.at(Mode.Decim) << "/" << BitDepthNames.at(Mode.Depth);
	return out;
}
