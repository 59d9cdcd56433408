#ifndef COMMON_HPP
#define COMMON_HPP

#include "std_include.hpp"

namespace common{

using std::size_t;
using std::string;
using std::any;
using std::vector;
using std::unordered_map;
using std::unique_ptr;
using namespace std::string_literals;

string const BUG_REPORT = "Please file a bug report with your log file (log.txt by default) and input matrix attached! Many thanks!";

class ChangeLog {
	struct Change {
		string code;
		string date;
		string author;
		string description;
		string level;

		Change(string const& code, string const& date, string const& author, string const& description, string const& level) noexcept : code(code), date(date), author(author), description(description), level(level) {}

		bool operator<(const Change& other) const noexcept {
			return date < other.date;
		}
	};

	struct Shared {
		vector<Change> all;
		unordered_map<string, vector<Change> > byCode;
		string globalVersion;
		string lastDate;
	};

	template<typename... Args> static void process(string const& code, string const& date, string const& author, string const& description, string const& level, Args... args) {
		if (date.size() != 10) {
			std::cerr << "Error: Invalid date format for change log entry (YYYY-MM-DD): " << date << std::endl;
			throw std::invalid_argument("Invalid change log date");
		}
		if (level != "minor" && level != "patch") {
			std::cerr << "Error: Invalid level format for change log entry (minor or patch): " << level << std::endl;
			throw std::invalid_argument("Invalid change log level");
		}

		Change change(code, date, author, description, level);
		shared.all.push_back(change);
		shared.byCode[code].push_back(change);
		if constexpr (sizeof...(args) > 0) {
			ChangeLog::process(code, std::forward<Args>(args)...);
		}
	}

public:
	static Shared shared;

	template<typename... Args> ChangeLog(Args... args) {
		ChangeLog::process(std::forward<Args>(args)...);
	}

	template<bool isGlobal> static vector<string> versioning(vector<Change>& changes) {
		string PREFIX = (isGlobal) ? "v1."s : "v"s;
		std::stable_sort(changes.begin(), changes.end());
		string lastDate = "2026-01-01"s, updates, version;
		bool hasMinor = false, hasPatch = false;
		vector<string> blocks;
		size_t minorVersion = 0, patchVersion = 0;
		for (const Change& change : changes) {
			if (change.date > lastDate) {
				blocks.push_back(version + updates);
				version = ""s;
				updates = " - "s + change.date + ":\n"s;
				lastDate = change.date;
				hasMinor = false;
				hasPatch = false;
			}
			if (change.level == "minor"s) {
				if (!hasMinor) minorVersion++;
				patchVersion = 0;
				hasMinor = true;
				hasPatch = true;
			}
			else if (change.level == "patch"s) {
				if (!hasPatch) patchVersion++;
				hasPatch = true;
			}
			version = PREFIX + std::to_string(minorVersion) + "."s + std::to_string(patchVersion);
			updates += "  * "s;
			if (isGlobal) updates += change.code + ": "s;
			updates += change.author + " - "s + change.description + "\n"s;
		}
		blocks.push_back(version + updates);
		if (isGlobal) {
			shared.globalVersion = (blocks.size() > 1) ? version : "v1.0.0";
			shared.lastDate = lastDate;
		}
		return blocks;
	}

	template<bool isGlobal> static void displayAll(std::ostream& out, vector<Change>& changes) {
		for (const string& block : versioning<isGlobal>(changes) | std::views::reverse) out << block;
	}

	string static getGlobalVersion() {
		versioning<true>(shared.all);
		return shared.globalVersion;
	}

	string static getLatestUpdateDate() {
		versioning<true>(shared.all);
		return shared.lastDate;
	}
};
ChangeLog::Shared ChangeLog::shared;

ChangeLog logChangeLog("ChangeLog",
	"2026-10-02", "fpc authors", "Version numbering restarted at v1", "minor");

ChangeLog logLogInfo("LogInfo",
	"2026-10-02", "fpc authors", "Initial code", "minor",
	"2026-10-09", "fpc authors", "Thread id prefix for multi-threaded quartet checks", "patch");

class LogInfo {
	struct Shared {
		unique_ptr<std::ostream> fout;
		int logVerbose = 0, errVerbose = 0;
		bool showThreadID = false;
	};

	static Shared shared;

public:
	static inline int constexpr DEFAULT_VERBOSE = 99;

	int verbose;

	LogInfo(int verbose = DEFAULT_VERBOSE) noexcept : verbose(verbose) {}

	LogInfo const& operator<<(auto const& t) const requires requires { {std::cerr << t}; } {
		if (verbose <= shared.errVerbose) std::cerr << t;
		if (shared.fout && verbose <= shared.logVerbose) (*shared.fout) << t;
		return *this;
	}

	LogInfo const& operator<<(std::ostream&t(std::ostream&)) const {
		if (verbose <= shared.errVerbose) std::cerr << t;
		if (shared.fout && verbose <= shared.logVerbose) (*shared.fout) << t;
		return *this;
	}

	LogInfo const& log() const noexcept {
		for (int i = 0; i < verbose; i++) *this << " ";
		*this << "- ";
		if (shared.showThreadID) *this << "[" << std::hash<std::thread::id>()(std::this_thread::get_id()) % 10000 << "] ";
		return *this;
	}

	static void setVerbose(std::ostream* fout, int logVerbose, int errVerbose) noexcept {
		shared.errVerbose = errVerbose;
		shared.logVerbose = logVerbose;
		if (fout) shared.fout.reset(fout);
	}

	static void setShowThread(bool show = true) noexcept {
		shared.showThreadID = show;
	}
};
LogInfo::Shared LogInfo::shared;

class Attributes: public LogInfo{
	unordered_map<string, any> attributes;

public:
	bool has(string const &attr) const noexcept{
		return attr.size() > 0 && attributes.contains(attr);
	}

	template<typename T> bool has(string const &attr) const noexcept{
		return has(attr) && attributes.at(attr).type() == typeid(T);
	}

	template<typename T> void set(string const &attr, T const &value) noexcept{
		attributes[attr] = value;
	}

	any get(string const &attr) const{
		return attributes.at(attr);
	}

	template<typename T> T get(string const &attr) const{
		return std::any_cast<T>(get(attr));
	}

	void erase(string const &attr) noexcept{
		attributes.erase(attr);
	}

	Attributes() noexcept{}
};

ChangeLog logInputParser("InputParser",
	"2026-10-02", "fpc authors", "Typed command line arguments with defaults", "minor",
	"2026-10-09", "fpc authors", "Numeric arguments for tolerances", "patch");

class InputParser : public Attributes {
	struct Argument {
		char shortcut;
		string name, type, description, defaultValue;
		bool optional, hasDefaultValue;
		int priority;

		bool operator<(const Argument& other) const noexcept {
			if (shortcut != 0 && other.shortcut == 0) return true;
			if (shortcut == 0 && other.shortcut != 0) return false;
			if (priority != other.priority) return priority > other.priority;
			if (optional != other.optional) return !optional;
			return name < other.name;
		}

		Argument(){}

		Argument(char shortcut, string const& name, string const& type, string const& description, int priority = 0, bool optional = false, bool hasDefaultValue = false, string defaultValue = "") noexcept : shortcut(shortcut), name(name), type(type), description(description), defaultValue(defaultValue), optional(optional), hasDefaultValue(hasDefaultValue), priority(priority) {}
	};

	vector<Argument> arguments;
	unordered_map<string, Argument> nameToArgument;
	unordered_map<char, Argument> shortcutToArgument;
	string argv0;

	Argument const& parseArg(string const& arg) const {
		if (arg.rfind("--", 0) == 0) {
			string name = arg.substr(2);
			if (name == "help") {
				displayHelp(std::cout);
				exit(0);
			}
			if (nameToArgument.count(name) == 0) {
				displayHelp(std::cerr);
				std::cerr << "Error: Unknown argument " << arg << std::endl;
				throw std::invalid_argument("Unknown argument");
			}
			return nameToArgument.at(name);
		}
		else if (arg.rfind("-", 0) == 0 && arg.size() == 2) {
			char shortcut = arg[1];
			if (shortcut == 'h') {
				displayHelp(std::cout);
				exit(0);
			}
			if (!shortcutToArgument.contains(shortcut)) {
				displayHelp(std::cerr);
				std::cerr << "Error: Unknown argument " << arg << std::endl;
				throw std::invalid_argument("Unknown argument");
			}
			return shortcutToArgument.at(shortcut);
		}
		else {
			displayHelp(std::cerr);
			std::cerr << "Error: Invalid argument format near: " << arg << std::endl;
			throw std::invalid_argument("Invalid argument format");
		}
	}

	void setTyped(Argument const& argument, string const& value, bool isDefault) {
		if (argument.type == "integer") {
			size_t realValue;
			try {
				realValue = std::stoull(value);
			}
			catch (const std::exception& e) {
				if (!isDefault) displayHelp(std::cerr);
				std::cerr << "Error: Invalid integer value for argument " << argument.name << ": " << value << std::endl;
				if (isDefault) std::cerr << BUG_REPORT << std::endl;
				throw std::invalid_argument("Invalid integer value");
			}
			set(argument.name, realValue);
		}
		else if (argument.type == "numeric") {
			double realValue;
			try {
				realValue = std::stod(value);
			}
			catch (const std::exception& e) {
				if (!isDefault) displayHelp(std::cerr);
				std::cerr << "Error: Invalid numeric value for argument " << argument.name << ": " << value << std::endl;
				if (isDefault) std::cerr << BUG_REPORT << std::endl;
				throw std::invalid_argument("Invalid numeric value");
			}
			set(argument.name, realValue);
		}
		else if (argument.type == "string") {
			set(argument.name, value);
		}
		else {
			std::cerr << "Error: Unknown argument type for argument " << argument.name << ". " << BUG_REPORT << std::endl;
			throw std::invalid_argument("Unknown argument type");
		}
	}

	void parse(const vector<string>& argv) {
		size_t argc = argv.size();
		for (size_t i = 0; i < argc; ++i) {
			if (i + 1 == argc && argv[i].size() > 0 && argv[i][0] != '-') {
				set("input", argv[i]);
				log() << "Warning: " << argv[i] << " is interpreted as: -i " << argv[i] << std::endl;
				break;
			}
			Argument const& argument = parseArg(argv[i]);
			if (argument.type == "flag") {
				set(argument.name, true);
			}
			else if (i + 1 < argc) {
				setTyped(argument, argv[++i], false);
			}
			else {
				displayHelp(std::cerr);
				std::cerr << "Error: Missing value for argument " << argument.name << std::endl;
				throw std::invalid_argument("Missing value for argument");
			}
		}
	}

public:
	InputParser() { verbose = 0; }

	template<typename... Args> void addArgument(Args... args) requires requires { {Argument{ std::forward<Args>(args)... } }; } {
		Argument argument(std::forward<Args>(args)...);
		if (nameToArgument.contains(argument.name)) {
			std::cerr << "Bug: Double-defined --" << argument.name << "!" << std::endl;
			throw std::invalid_argument("Argument name double-defined");
		}
		if (shortcutToArgument.contains(argument.shortcut)) {
			std::cerr << "Bug: Double-defined -" << argument.shortcut << "!" << std::endl;
			throw std::invalid_argument("Argument shortcut double-defined");
		}
		arguments.push_back(argument);
		nameToArgument[argument.name] = argument;
		if (argument.shortcut > 0) shortcutToArgument[argument.shortcut] = argument;
	}

	void displayHelp(std::ostream& out) const {
		out << (has<string>("FULL_NAME") ? get<string>("FULL_NAME") : "fpc"s) << " " << ChangeLog::getGlobalVersion() << " (" << ChangeLog::getLatestUpdateDate() << ")" << std::endl;
		out << "Available arguments:" << std::endl;
		for (Argument const& argument : arguments) {
			out << "  ";
			if (argument.shortcut > 0) out << "-" << argument.shortcut << ", ";
			else out << "    ";
			out << "--" << argument.name << " <" << argument.type << "> : " << argument.description;
			if (argument.optional) out << " (optional";
			else out << " (required";
			if (argument.hasDefaultValue) out << ", default=" << argument.defaultValue;
			out << ")" << std::endl;
		}
	}

	void parse(int argc, char* argv[]) {
		if (argc == 1) {
			displayHelp(std::cout);
			exit(0);
		}
		argv0 = argv[0];
		vector<string> args;
		for (int i = 1; i < argc; ++i) args.push_back(string(argv[i]));
		parse(args);
		std::sort(arguments.begin(), arguments.end());
		for (Argument const& argument : arguments) {
			if (has(argument.name)) continue;
			if (argument.optional && argument.hasDefaultValue) setTyped(argument, argument.defaultValue, true);
			else if (!argument.optional) {
				displayHelp(std::cerr);
				std::cerr << "Error: Missing required argument --" << argument.name << std::endl;
				throw std::invalid_argument("Missing required argument");
			}
		}
	}

	void print() {
		*this << (has<string>("FULL_NAME") ? get<string>("FULL_NAME") : "fpc"s) << " " << ChangeLog::getGlobalVersion() << " (" << ChangeLog::getLatestUpdateDate() << ")" << std::endl;
		*this << argv0;
		for (Argument const& argument : arguments) {
			if (has(argument.name)) {
				*this << " --" << argument.name;
				if (argument.type == "integer") *this << " " << get<size_t>(argument.name);
				else if (argument.type == "numeric") *this << " " << get<double>(argument.name);
				else if (argument.type == "string") *this << " " << get<string>(argument.name);
				else if (argument.type != "flag") {
					std::cerr << "Error: Unknown argument type for argument " << argument.name << ". " << BUG_REPORT << std::endl;
					throw std::invalid_argument("Unknown argument type");
				}
			}
		}
		*this << std::endl;
	}
};

};
common::InputParser	ARG;

using common::ChangeLog;

#endif
