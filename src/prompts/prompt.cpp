#include "mcpeasy/prompts/prompt.hpp"

namespace mcpeasy::prompts
{

std::string render(const std::string& tmpl,
                   const std::unordered_map<std::string, std::string>& vars)
{
    // Single pass over the template; substituted text is never rescanned.
    std::string out;
    out.reserve(tmpl.size());
    size_t pos = 0;
    while (pos < tmpl.size())
    {
        size_t open = tmpl.find('{', pos);
        if (open == std::string::npos)
            break;
        size_t close = tmpl.find('}', open + 1);
        if (close == std::string::npos)
            break;

        out.append(tmpl, pos, open - pos);
        auto it = vars.find(tmpl.substr(open + 1, close - open - 1));
        if (it != vars.end())
        {
            out += it->second;
            pos = close + 1;
        }
        else
        {
            // Not a known key: keep the brace and resume right after it.
            out.push_back('{');
            pos = open + 1;
        }
    }
    out.append(tmpl, pos, std::string::npos);
    return out;
}

std::unordered_map<std::string, std::string> string_arguments(const Json& arguments)
{
    std::unordered_map<std::string, std::string> vars;
    if (!arguments.is_object())
        return vars;
    for (auto it = arguments.begin(); it != arguments.end(); ++it)
    {
        if (it->is_string())
            vars[it.key()] = it->get<std::string>();
        else if (!it->is_null())
            vars[it.key()] = it->dump();
    }
    return vars;
}

std::vector<PromptMessage> Prompt::messages(const Json& arguments) const
{
    if (generator)
        return generator(arguments);
    return {PromptMessage{"user", render(tmpl, string_arguments(arguments))}};
}

Json Prompt::to_json() const
{
    Json args = Json::array();
    for (const auto& arg : arguments)
        args.push_back(
            {{"name", arg.name}, {"description", arg.description}, {"required", arg.required}});
    return Json{{"name", name}, {"description", description}, {"arguments", args}};
}

} // namespace mcpeasy::prompts
