#include "Diagnostics/ErrorReporter.hpp"

#include <iostream>

#include <Native/MTInterface.hpp>

using namespace std;

ostream& operator << (ostream& out, const Diagnostic& diag)
{
	out << (diag.Severity == DiagnosticSeverity::Fatal ? "ERROR: " : "WARNING: ")
		<< DiagnosticKindNames.at(diag.Kind) << " in " << diag.Operation << ": " << diag.Message;
	return out;
}

ErrorReporter::ErrorReporter(MTInterface* InNative, size_t InMaxHistory)
	:Native(InNative), MaxHistory(InMaxHistory), Silent(false)
{
}

const Diagnostic& ErrorReporter::Record(Diagnostic diag)
{
	ReportCount++;
	if (!Silent)
	{
		cerr << diag << endl;
	}
	if (MaxHistory > 0 && History.size() >= MaxHistory)
	{
		History.erase(History.begin());
	}
	History.push_back(std::move(diag));
	return History.back();
}

Diagnostic ErrorReporter::Report(const string &Operation)
{
	string message = "MTC not initialized";
	if (Native != nullptr)
	{
		const char* text = Native->MTLastErrorString();
		message = text != nullptr ? string(text) : string("no error text available");
	}
	return Record({DiagnosticKind::NativeCallFailure, DiagnosticSeverity::Warning, Operation, message});
}

Diagnostic ErrorReporter::Warn(DiagnosticKind Kind, const string &Operation, const string &Message)
{
	return Record({Kind, DiagnosticSeverity::Warning, Operation, Message});
}

Diagnostic ErrorReporter::Fatal(DiagnosticKind Kind, const string &Operation, const string &Message)
{
	return Record({Kind, DiagnosticSeverity::Fatal, Operation, Message});
}

bool ErrorReporter::HasFatal() const
{
	for (auto &diag : History)
	{
		if (diag.Severity == DiagnosticSeverity::Fatal)
		{
			return true;
		}
	}
	return false;
}

void ErrorReporter::Clear()
{
	History.clear();
}
