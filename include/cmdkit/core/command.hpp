/**
 * @file command.hpp
 * @brief A callable plus its argument schema, and the parse/dispatch algorithm.
 *
 * Commands are built and decorated during start-up, then moved into a
 * Registry which only hands out const references: the schema is frozen
 * from that point on.
 *
 * @copyright Copyright (c) 2024 cmdkit Contributors
 * @license MIT License
 */

#pragma once

#include "cmdkit/core/arg_parser.hpp"
#include "cmdkit/core/argument.hpp"
#include "cmdkit/core/context.hpp"
#include "cmdkit/core/export.hpp"
#include "cmdkit/core/signature.hpp"
#include "cmdkit/core/value.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace cmdkit {

/// Extra named values received by a keyword catch-all.
using Kwargs = Map;

/// Raw argument list received by a capture-all command.
using Argv = std::vector<std::string>;

/**
 * @class CallArgs
 * @brief Resolved arguments handed to a command handler.
 */
class CMDKIT_CORE_API CallArgs {
public:
    /**
     * @brief Set a declared value; appends on first use, so declaration
     *        order is kept.
     */
    void set(const std::string& name, Value value);

    /**
     * @brief Value of a declared or extra argument.
     * @throws ArgumentNotFound if neither has the name
     */
    const Value& get(const std::string& name) const;

    bool has(const std::string& name) const { return find(name) != nullptr; }

    /**
     * @brief Declared or extra value, nullptr when absent.
     */
    const Value* find(const std::string& name) const;
    Value* find(const std::string& name);

    /**
     * @brief Declared value by position.
     */
    const Value& at(size_t index) const { return values_.at(index).second; }
    const std::string& name_at(size_t index) const { return values_.at(index).first; }
    size_t size() const { return values_.size(); }

    const Map& values() const { return values_; }

    Kwargs& extra() { return extra_; }
    const Kwargs& extra() const { return extra_; }

    const Argv& raw() const { return raw_; }
    void set_raw(Argv raw) { raw_ = std::move(raw); }

    /**
     * @brief Record that a value came from the command line.
     */
    void mark_given(const std::string& name) { given_.insert(name); }
    bool given(const std::string& name) const { return given_.count(name) > 0; }

private:
    Map values_;
    Kwargs extra_;
    Argv raw_;
    std::set<std::string> given_;
};

using Handler = std::function<Value(const CallArgs&)>;

/**
 * @struct EnvBinding
 * @brief Environment variable injected into a parameter at call time.
 */
struct EnvBinding {
    std::string variable;
    std::optional<std::string> default_value;  ///< unset means required
    std::string target;                        ///< parameter receiving the value
};

class CMDKIT_CORE_API Command {
public:
    /// Description used when the command carries no documentation.
    static constexpr const char* kNoDescription = "no description";

    /**
     * @brief Command with a schema inspected from a signature.
     * @param name Command name (normalized to snake_case, dashless)
     * @param signature Parameter list of the handler
     * @param handler Callable invoked with the resolved arguments
     * @param doc Documentation; its first line becomes the description
     * @throws SchemaError if the signature is invalid
     */
    Command(std::string name, const Signature& signature, Handler handler, std::string doc = "");

    /**
     * @brief Command without arguments or behaviour (returns none).
     */
    explicit Command(std::string name);

    /**
     * @brief Command receiving the whole raw argument list.
     */
    static Command raw(std::string name, Handler handler, std::string doc = "");

    const std::string& name() const { return name_; }
    const std::string& namespace_name() const { return namespace_; }
    std::string path() const;
    const std::string& description() const { return description_; }
    const std::vector<Argument>& arguments() const { return arguments_; }
    bool capture_all() const { return capture_all_; }
    bool accepts_extra() const { return accepts_extra_; }
    const std::vector<EnvBinding>& env_bindings() const { return env_bindings_; }

    void set_namespace(std::string ns) { namespace_ = std::move(ns); }
    void set_description(const std::string& doc);

    // =========================================================================
    // Schema mutation (before registration only)
    // =========================================================================

    /**
     * @brief Append an argument.
     * @throws SchemaError on a duplicate name (a synthesized entry is merged
     *         once instead) or on a capture-all command
     */
    void add_argument(Argument argument);

    /**
     * @brief Existing argument by name.
     * @throws ArgumentNotFound
     */
    Argument& get_argument(const std::string& name);
    const Argument& get_argument(const std::string& name) const;

    /**
     * @brief Position of an argument in the schema.
     * @throws ArgumentNotFound
     */
    size_t position_of(const std::string& name) const;

    bool has_argument(const std::string& name) const;

    /**
     * @brief Attach an environment binding.
     * @throws SchemaError if the target is neither declared nor absorbable
     *         by a keyword catch-all
     */
    void add_env_binding(EnvBinding binding);

    /**
     * @brief Build the parser surface once; called on registration.
     * @throws SchemaError on conflicting option strings
     */
    void finalize();

    // =========================================================================
    // Invocation
    // =========================================================================

    /**
     * @brief Parse arguments, invoke the handler and write its output.
     *
     * Usage errors print the usage and the error to ctx.err() and return 2.
     * Error (including prompt failures) prints its message to ctx.err()
     * and returns 1. A false result returns 1, anything else 0.
     *
     * @throws MissingEnvironmentError for a required env binding
     */
    int parse(const std::vector<std::string>& args, Context& ctx) const;

    /**
     * @brief Tokenize and resolve arguments without invoking.
     * @return std::nullopt if help was requested (and printed)
     * @throws UsageError, PromptError
     */
    std::optional<CallArgs> bind(const std::vector<std::string>& args, Context& ctx) const;

    /**
     * @brief Apply env bindings and invoke the handler.
     *
     * A binding target given on the command line keeps its value; any
     * other target takes the variable, then the binding's default.
     *
     * @throws MissingEnvironmentError
     */
    Value call(CallArgs args, const Context& ctx) const;

    /**
     * @brief Arguments holding every default (none for required ones).
     */
    CallArgs defaults() const;

    std::string usage() const;
    void print_help(std::ostream& out) const;

private:
    std::string name_;
    std::string namespace_;
    std::string description_ = kNoDescription;
    std::vector<Argument> arguments_;
    Handler handler_;
    bool capture_all_ = false;
    bool accepts_extra_ = false;
    std::vector<EnvBinding> env_bindings_;
    std::shared_ptr<const ArgParser> parser_;

    ArgParser build_parser() const;
    bool is_env_target(const std::string& name) const;
    Value resolve(const Argument& argument, const ParseResult& parsed, Context& ctx) const;
    Value coerce(const Argument& argument, const Value& raw, const std::string& source) const;
};

} // namespace cmdkit
