#include <stdexcept>
#include "conformation.hpp"

bool is_bridge_type(const string& token)
{
	return token == "FF" || token == "FB" || token == "BF" || token == "BB";
}

bridge_type parse_bridge_type(const string& token)
{
	if (token == "FF") return bridge_type::FF;
	if (token == "FB") return bridge_type::FB;
	if (token == "BF") return bridge_type::BF;
	if (token == "BB") return bridge_type::BB;
	throw invalid_argument("Invalid bridge_type: " + token);
}

array<double, 4> bridge_rotation(const bridge_type b, const double delta)
{
	const array<double, 3> x_axis = { 1, 0, 0 };
	const array<double, 3> z_axis = { 0, 0, 1 };
	const array<double, 4> flip = vec4_to_qtn4(x_axis, 180);

	// The metal joint turns about the front face normal. A back face binding views the joint upside down.
	array<double, 4> q = vec4_to_qtn4(z_axis, delta);
	if (b == bridge_type::BF || b == bridge_type::BB) q = compose(flip, q);
	if (b == bridge_type::FB || b == bridge_type::BB) q = compose(q, flip);
	return normalize(q);
}

string strip_brackets(const string& conf_id)
{
	string s;
	s.reserve(conf_id.size());
	for (const char c : conf_id)
	{
		if (c == '(' || c == ')') continue;
		s.push_back(c);
	}
	return s;
}

conformation::conformation(const string& conf_id)
{
	const string s = strip_brackets(conf_id);
	if (s.size() & 1) throw invalid_argument("Invalid conformation ID " + conf_id + ": odd number of characters");
	reserve(s.size() >> 1);
	bool bridged = true; // No ligand is waiting for its bridge yet.
	for (size_t i = 0; i < s.size(); i += 2)
	{
		const string token = s.substr(i, 2);
		if (is_lig_type(token))
		{
			push_back(ring_unit(parse_lig_type(token)));
			bridged = false;
		}
		else if (is_bridge_type(token))
		{
			if (bridged) throw invalid_argument("Invalid conformation ID " + conf_id + ": bridge " + token + " does not follow a ligand");
			back().bridge = parse_bridge_type(token);
			bridged = true;
		}
		else
		{
			throw invalid_argument("Invalid conformation ID " + conf_id + ": unknown token " + token);
		}
	}
	if (empty()) throw invalid_argument("Invalid conformation ID " + conf_id + ": no ligand");
}

string conformation::str() const
{
	static const char* const bridge_tokens[] = { "FF", "FB", "BF", "BB" };
	string s;
	s.reserve(size() << 2);
	for (const auto& u : *this)
	{
		s += to_string(u.lig);
		s += bridge_tokens[static_cast<size_t>(u.bridge)];
	}
	return s;
}
