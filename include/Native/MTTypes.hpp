#pragma once

#include <cstdint>
#include <iosfwd>
#include <map>
#include <string>
#include <optional>

//Raw types of the MTC binary interface. Everything here crosses the foreign boundary as-is.

typedef int64_t mtHandle;
const mtHandle mtHandleNull = 0;

//Completion code returned by most MTC calls, 0 is success
typedef int32_t mtCompletionCode;
const mtCompletionCode mtOK = 0;

//Capacity of every string buffer handed to MTC
constexpr int MT_MAX_STRING_LENGTH = 400;

enum class FrameType : int32_t
{
	None = 0, //Error state, no frame type set
	Full = 1, //Frames received at full resolution and bit depth
	ROIs = 2, //Only XPoint regions of interest are received
	Alternating = 3 //Alternating frames of ROIs and image data
};

enum class Decimation : int32_t
{
	None = 0,
	Dec11 = 1, //no decimation
	Dec21 = 2, //every 2nd row and column is kept
	Dec41 = 3 //every 4th row and column is kept
};

enum class BitDepth : int32_t
{
	None = 0,
	Bpp14 = 1,
	Bpp12 = 2
};

const std::map<FrameType, std::string> FrameTypeNames = {
	{FrameType::None, 			"None"},
	{FrameType::Full, 			"Full"},
	{FrameType::ROIs, 			"ROIs"},
	{FrameType::Alternating, 	"Alternating"}
};

const std::map<Decimation, std::string> DecimationNames = {
	{Decimation::None, 	"None"},
	{Decimation::Dec11, "Dec11"},
	{Decimation::Dec21, "Dec21"},
	{Decimation::Dec41, "Dec41"}
};

const std::map<BitDepth, std::string> BitDepthNames = {
	{BitDepth::None, 	"None"},
	{BitDepth::Bpp14, 	"Bpp14"},
	{BitDepth::Bpp12, 	"Bpp12"}
};

//Reverse lookup in one of the name tables above
template<class EnumType>
std::optional<EnumType> EnumFromName(const std::map<EnumType, std::string> &Names, const std::string &Name)
{
	for (auto &i : Names)
	{
		if (i.second == Name)
		{
			return i.first;
		}
	}
	return std::nullopt;
}

//Streaming mode record, passed by pointer to Cameras_StreamingModeSet
struct mtStreamingModeStruct
{
	int32_t frameType;
	int32_t decimation;
	int32_t bitDepth;
};

static_assert(sizeof(mtStreamingModeStruct) == 3*sizeof(int32_t), "mtStreamingModeStruct must be three packed 32-bit codes");

struct StreamingMode
{
	FrameType Frame = FrameType::Alternating;
	Decimation Decim = Decimation::Dec41;
	BitDepth Depth = BitDepth::Bpp14;

	mtStreamingModeStruct ToNative() const
	{
		return {static_cast<int32_t>(Frame), static_cast<int32_t>(Decim), static_cast<int32_t>(Depth)};
	}

	bool operator==(const StreamingMode &other) const
	{
		return Frame == other.Frame && Decim == other.Decim && Depth == other.Depth;
	}
};

std::ostream& operator << (std::ostream& out, const StreamingMode& Mode);
