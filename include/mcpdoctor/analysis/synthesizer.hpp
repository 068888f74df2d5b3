#pragma once
/// @file analysis/synthesizer.hpp
/// @brief Build minimal/typical/large argument sets from an input schema.

#include "mcpdoctor/analysis/heuristics.hpp"
#include "mcpdoctor/client/types.hpp"
#include "mcpdoctor/types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace mcpdoctor::analysis
{

struct Scenario
{
    std::string name; ///< minimal, typical or large
    std::string operation;
    Json arguments = Json::object();
    std::string description;

    Json to_json() const;
};

/// One row of the value-generation table. Rows are tried top to bottom.
struct ValueRule
{
    std::string label;
    /// (lower-cased parameter name, lower-cased declared type, property schema)
    std::function<bool(const std::string&, const std::string&, const Json&)> matches;
    std::function<Json(const Json&)> generate;
};

/// Rules in evaluation order: url-like, enum/const, email-like, query-like,
/// id-like, then per-type defaults.
const std::vector<ValueRule>& default_value_rules();

/// Declared JSON type of a property schema, lower-cased; the first non-null
/// member of a type array; empty when absent.
std::string declared_type(const Json& property_schema);

/// Deterministic and side-effect free.
class ArgumentSynthesizer
{
  public:
    explicit ArgumentSynthesizer(Heuristics heuristics = {});

    /// Always three scenarios, in order minimal, typical, large
    std::vector<Scenario> scenarios(const client::Operation& operation) const;

    /// Sample value for one parameter
    Json value_for(const std::string& name, const Json& property_schema) const;

    const Heuristics& heuristics() const
    {
        return heuristics_;
    }

  private:
    Json minimal_arguments(const client::Operation& operation) const;
    void add_pagination(Json& args, const client::Operation& operation, int page_size) const;

    Heuristics heuristics_;
};

} // namespace mcpdoctor::analysis
