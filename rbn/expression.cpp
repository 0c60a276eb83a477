#include "expression.h"
#include "network.h"
#include <common/message.h>
#include <common/text.h>

#include <algorithm>
#include <cstring>

#include <parse/tokenizer.h>
#include <parse_expression/expression.h>
#include <parse_cog/expression.h>
#include <interpret_boolean/import.h>
#include <interpret_boolean/export.h>

namespace rbn
{

string emit_expression(boolean::cover expr, ucs::ConstNetlist nets)
{
	return export_expression<parse_cog::expression>(expr, nets).to_string();
}

// A minterm satisfies a cube if it agrees with every variable the cube
// fixes. The cover is the disjunction of its cubes.
int evaluate(const boolean::cover &expr, const vector<int> &values)
{
	for (int i = 0; i < (int)expr.cubes.size(); i++)
	{
		bool match = true;
		for (int v = 0; v < (int)values.size() and match; v++)
		{
			int c = expr.cubes[i].get(v);
			match = c == 2 or c == (values[v] != 0 ? 1 : 0);
		}

		if (match)
			return 1;
	}
	return 0;
}

vector<int> variables(const boolean::cover &expr, int count)
{
	vector<int> result;
	for (int v = 0; v < count; v++)
	{
		bool used = false;
		for (int i = 0; i < (int)expr.cubes.size() and not used; i++)
		{
			int c = expr.cubes[i].get(v);
			used = c == 0 or c == 1;
		}

		if (used)
			result.push_back(v);
	}
	return result;
}

boolean::cover remap(const boolean::cover &expr, const vector<int> &mapping)
{
	boolean::cover result;
	for (int i = 0; i < (int)expr.cubes.size(); i++)
	{
		boolean::cube term = 1;
		for (int v = 0; v < (int)mapping.size(); v++)
		{
			int c = expr.cubes[i].get(v);
			if (mapping[v] >= 0 and (c == 0 or c == 1))
				term.set(mapping[v], c);
		}
		result = result | boolean::cover(term);
	}
	return result;
}

namespace {

bool is_identifier_start(char c)
{
	return (c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z') or c == '_';
}

bool is_identifier_char(char c)
{
	return is_identifier_start(c) or (c >= '0' and c <= '9');
}

// Rewrite the operators of a printed expression into the .bnet grammar. Every
// identifier is handed to rename, which may replace it or reject it.
template <typename renamer>
bool rewrite(const string &text, renamer rename, string &result)
{
	static const char *neg[3] = {"¬", "~", "!"};
	static const char *conj[2] = {"∧", "&"};
	static const char *disj[2] = {"∨", "|"};

	result.clear();
	size_t pos = 0;
	while (pos < text.size())
	{
		bool matched = false;
		for (int i = 0; i < 3 and not matched; i++)
			if (text.compare(pos, strlen(neg[i]), neg[i]) == 0)
			{
				result.push_back('!');
				pos += strlen(neg[i]);
				matched = true;
			}
		for (int i = 0; i < 2 and not matched; i++)
			if (text.compare(pos, strlen(conj[i]), conj[i]) == 0)
			{
				result.push_back('&');
				pos += strlen(conj[i]);
				matched = true;
			}
		for (int i = 0; i < 2 and not matched; i++)
			if (text.compare(pos, strlen(disj[i]), disj[i]) == 0)
			{
				result.push_back('|');
				pos += strlen(disj[i]);
				matched = true;
			}
		if (matched)
			continue;

		char c = text[pos];
		if (c == '(' or c == ')' or c == ' ' or c == '0' or c == '1')
		{
			result.push_back(c);
			pos++;
		}
		else if (is_identifier_start(c))
		{
			size_t start = pos;
			while (pos < text.size() and is_identifier_char(text[pos]))
				pos++;
			string name = text.substr(start, pos-start);

			string replacement;
			if (name == "true" or name == "True")
				replacement = "1";
			else if (name == "false" or name == "False")
				replacement = "0";
			else if (not rename(name, replacement))
				return false;
			result += replacement;
		}
		else
			return false;
	}

	return true;
}

}

bool parse_bnet_expression(const string &text, netlist &nets, boolean::cover &result)
{
	result = boolean::cover();

	string source = trim(text);
	if (source == "1" or source == "true" or source == "True")
	{
		result = 1;
		return true;
	}
	else if (source == "0" or source == "false" or source == "False")
		return true;

	// The haystack expression grammar writes negation as '~' and constants as
	// 0 and 1.
	string converted;
	if (not rewrite(source, [](const string &name, string &out) {
			out = name;
			return true;
		}, converted))
	{
		error("", "unexpected symbol in rule \"" + source + "\"", __FILE__, __LINE__);
		return false;
	}
	replace(converted.begin(), converted.end(), '!', '~');

	tokenizer tokens;
	parse_expression::expression::register_syntax(tokens);
	tokens.insert("bnet_rule", converted, nullptr);

	tokens.increment(false);
	tokens.expect<parse_expression::expression>();
	if (tokens.decrement(__FILE__, __LINE__))
	{
		parse_expression::expression syntax(tokens);
		if (syntax.valid)
		{
			result = import_cover(syntax, nets, 0, &tokens, true);
			return true;
		}
	}

	error("", "unable to parse rule \"" + source + "\"", __FILE__, __LINE__);
	return false;
}

bool to_bnet(const string &text, string &result)
{
	return rewrite(text, [](const string &name, string &out) {
		out = name;
		return true;
	}, result);
}

bool translate_expression(const string &text, const map<string, int> &ids, string &result)
{
	return rewrite(text, [&ids](const string &name, string &out) {
		auto id = ids.find(name);
		if (id == ids.end())
			return false;
		out = "v" + ::to_string(id->second);
		return true;
	}, result);
}

}
