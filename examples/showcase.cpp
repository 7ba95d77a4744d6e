//! # Showcase
//!
//! Wraps a small command-line program with every kind of argument. Started
//! normally it opens a line-based console in place of a graphical front end:
//!
//! ```text
//! > set required_field hello
//! > select subcommand-a inner-subcommand-a
//! > add multiple_values x
//! > run
//! > wait
//! ```
//!
//! `run` re-executes this binary as the child, which prints its matches and
//! a progress bar.

#include "app/entry.hpp"
#include "log/log.hpp"
#include "output/output_parser.hpp"
#include "schema/command_spec.hpp"

#include <chrono>
#include <iostream>
#include <sstream>
#include <thread>

using namespace argrun;

namespace {

schema::CommandDef define_cli() {
    using schema::ArgAction;
    using schema::ArgDef;
    using schema::CommandDef;

    CommandDef inner_inner_a("a");
    inner_inner_a.about("About 2");

    CommandDef inner_b("inner-subcommand-b");
    inner_b.about("About")
        .subcommand(std::move(inner_inner_a))
        .subcommand(CommandDef("b"))
        .subcommand_required();

    CommandDef inner_a("inner-subcommand-a");
    inner_a.arg(ArgDef("multiple_values").long_name("multiple-values").short_name('m').action(
        ArgAction::Append));

    CommandDef sub_a("subcommand-a");
    sub_a.about("Subcommands also display help")
        .arg(ArgDef("native_path_picker")
                 .long_name("native-path-picker")
                 .value_hint(schema::PathHint::Either))
        .arg(ArgDef("choose_one").required().possible_values({"One", "Two", "Three"}))
        .subcommand(std::move(inner_a))
        .subcommand(std::move(inner_b))
        .subcommand(CommandDef("inner-subcommand-c"))
        .subcommand(CommandDef("inner-subcommand-d"))
        .subcommand_required();

    CommandDef root("showcase");
    root.about("Help is displayed at the top")
        .arg(ArgDef("required_field").required().help("Argument help is displayed as tooltips"))
        .arg(ArgDef("optional_field").long_name("optional-field"))
        .arg(ArgDef("field_with_default")
                 .long_name("field-with-default")
                 .default_value("default value"))
        .arg(ArgDef("flag").long_name("flag").action(ArgAction::SetTrue))
        .arg(ArgDef("count_occurrences_as_a_nice_counter")
                 .long_name("count-occurrences-as-a-nice-counter")
                 .short_name('c')
                 .action(ArgAction::Count))
        .subcommand(std::move(sub_a))
        .subcommand(CommandDef("subcommand-b"))
        .subcommand_required();
    return root;
}

// ============================================================================
// Child side
// ============================================================================

void print_matches(const matcher::ArgMatches& matches, int depth) {
    std::string indent(static_cast<size_t>(depth) * 2, ' ');
    std::cout << indent << matches.command() << "\n";
    for (const char* id : {"required_field", "optional_field", "field_with_default",
                           "native_path_picker", "choose_one"}) {
        if (auto value = matches.get_one(id)) {
            std::cout << indent << "  " << id << " = " << *value << "\n";
        }
    }
    for (const auto& value : matches.get_many("multiple_values")) {
        std::cout << indent << "  multiple_values += " << value << "\n";
    }
    if (matches.get_flag("flag")) {
        std::cout << indent << "  flag\n";
    }
    if (auto count = matches.get_count("count_occurrences_as_a_nice_counter")) {
        std::cout << indent << "  counter = " << count << "\n";
    }
    if (const auto* sub = matches.subcommand_matches()) {
        print_matches(*sub, depth + 1);
    }
}

int child_main(const matcher::ArgMatches& matches) {
    print_matches(matches, 0);
    for (int step = 0; step <= 4; ++step) {
        std::cout << output::progress_bar("work", "Working", static_cast<float>(step) / 4.0f)
                  << std::flush;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return 0;
}

// ============================================================================
// Host side
// ============================================================================

/// First node on the selected branch that declares `id` (the root if none).
state::CommandState& owner_of(state::CommandState& root, const std::string& id) {
    for (state::CommandState* node = &root; node; node = node->child()) {
        if (node->spec().find_arg(id)) {
            return *node;
        }
    }
    return root;
}

void show(const state::CommandState& node, const app::Localization& loc, int depth) {
    std::string indent(static_cast<size_t>(depth) * 2, ' ');
    std::cout << indent << "[" << node.spec().name << "]\n";
    for (const auto& slot : node.slots()) {
        std::cout << indent << "  " << slot.spec->display_name;
        if (!slot.spec->required) {
            std::cout << " " << loc.get("optional");
        }
        std::cout << ": ";
        std::visit(
            [](const auto& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, state::SingleValue>) {
                    std::cout << "'" << v.value.text << "'";
                } else if constexpr (std::is_same_v<T, state::MultipleValue>) {
                    for (const auto& entry : v.values) {
                        std::cout << "'" << entry.text << "' ";
                    }
                } else if constexpr (std::is_same_v<T, state::FlagValue>) {
                    std::cout << (v.set ? "on" : "off");
                } else {
                    std::cout << v.count;
                }
            },
            slot.value.kind);
        if (slot.value.validation_error) {
            std::cout << "  <- " << *slot.value.validation_error;
        }
        std::cout << "\n";
    }
    if (const auto* child = node.child()) {
        show(*child, loc, depth + 1);
    }
}

void print_output(const std::string& snapshot) {
    for (const auto& segment : output::parse_output(snapshot)) {
        if (const auto* text = std::get_if<output::TextSegment>(&segment)) {
            std::cout << text->text;
        } else {
            const auto& bar = std::get<output::ProgressSegment>(segment);
            std::cout << bar.description << ": " << static_cast<int>(bar.value * 100.0f)
                      << "%\n";
        }
    }
}

void report(const app::RunOutcome& outcome) {
    std::visit(
        [](const auto& o) {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, app::RunStarted>) {
                std::cout << "started pid " << o.pid << "\n";
            } else {
                std::cout << o.message << "\n";
            }
        },
        outcome);
}

void report_error(const state::StateResult& result) {
    if (is_err(result)) {
        std::cout << unwrap_err(result).message() << "\n";
    }
}

int console(app::Session& session) {
    const auto& loc = session.settings().localization;
    std::string line;
    std::cout << "> " << std::flush;
    while (std::getline(std::cin, line)) {
        std::istringstream in(line);
        std::string command, id, text;
        in >> command >> id;
        std::getline(in >> std::ws, text);
        state::CommandState& node = owner_of(session.state(), id);

        if (command == "set") {
            report_error(node.set_single(id, text));
        } else if (command == "add") {
            report_error(node.add_multiple(id, text));
        } else if (command == "toggle") {
            report_error(node.toggle_flag(id));
        } else if (command == "inc") {
            report_error(node.increment_counter(id));
        } else if (command == "dec") {
            report_error(node.decrement_counter(id));
        } else if (command == "select") {
            // select <name> [<name>...] chooses a branch from the root down
            std::istringstream names(id + " " + text);
            state::CommandPath path;
            std::string name;
            while (names >> name) {
                report_error(session.state().select_subcommand(path, name));
                path.push_back(name);
            }
        } else if (command == "show") {
            show(session.state(), loc, 0);
        } else if (command == "run") {
            report(session.run({}));
        } else if (command == "wait") {
            if (auto status = session.orchestrator().wait()) {
                print_output(session.orchestrator().handle()->output_snapshot());
                std::cout << process::status_name(*status) << "\n";
            }
        } else if (command == "kill") {
            session.orchestrator().kill();
        } else if (command == "quit") {
            break;
        } else if (!command.empty()) {
            std::cout << "commands: set add toggle inc dec select show run wait kill quit\n";
        }
        std::cout << "> " << std::flush;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    // Only ARGRUN_LOG is consulted; argv belongs to the wrapped schema
    log::Logger::init(log::parse_log_options(1, argv));

    auto spec = schema::build_spec(define_cli());
    if (is_err(spec)) {
        std::cerr << unwrap_err(spec).message() << "\n";
        return 1;
    }

    app::Settings settings;
    settings.enable_env = "";
    settings.enable_working_dir = "";
    return app::run_app(unwrap(spec), std::move(settings), argc, argv, child_main, console);
}
