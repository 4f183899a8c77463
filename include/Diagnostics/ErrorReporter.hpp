#pragma once

#include <map>
#include <string>
#include <vector>
#include <iosfwd>

class MTInterface;

enum class DiagnosticKind
{
	LibraryLoadFailure,
	ConfigurationMissing,
	NoCameraFound,
	NativeCallFailure,
	MarkerNotLocated
};

enum class DiagnosticSeverity
{
	Warning, //this call failed, the session keeps working
	Fatal //the session is unusable
};

const std::map<DiagnosticKind, std::string> DiagnosticKindNames = {
	{DiagnosticKind::LibraryLoadFailure, 	"LibraryLoadFailure"},
	{DiagnosticKind::ConfigurationMissing, 	"ConfigurationMissing"},
	{DiagnosticKind::NoCameraFound, 		"NoCameraFound"},
	{DiagnosticKind::NativeCallFailure, 	"NativeCallFailure"},
	{DiagnosticKind::MarkerNotLocated, 		"MarkerNotLocated"}
};

struct Diagnostic
{
	DiagnosticKind Kind;
	DiagnosticSeverity Severity;
	std::string Operation;
	std::string Message;
};

std::ostream& operator << (std::ostream& out, const Diagnostic& diag);

//Reports failing MTC calls.
//MTC keeps a single, process-wide last error : Report must be called right after the failing call,
//before any other MTC call overwrites it.
//Never throws. Every report is printed to cerr and kept in a bounded history.
class ErrorReporter
{
private:
	MTInterface* Native;
	std::vector<Diagnostic> History;
	size_t MaxHistory;
	bool Silent;
	size_t ReportCount = 0;

	const Diagnostic& Record(Diagnostic diag);

public:
	ErrorReporter(MTInterface* InNative, size_t InMaxHistory = 256);

	//Don't print to cerr, still record
	void SetSilent(bool value)
	{
		Silent = value;
	}

	//Fetches the native error text for a failed call to Operation
	Diagnostic Report(const std::string &Operation);

	Diagnostic Warn(DiagnosticKind Kind, const std::string &Operation, const std::string &Message);

	Diagnostic Fatal(DiagnosticKind Kind, const std::string &Operation, const std::string &Message);

	const std::vector<Diagnostic>& GetDiagnostics() const
	{
		return History;
	}

	//Number of diagnostics recorded since creation, including those dropped from the history
	size_t GetReportCount() const
	{
		return ReportCount;
	}

	bool HasFatal() const;

	void Clear();
};
