#pragma once
#ifndef RSUANALYZER_CONFORMATION_HPP
#define RSUANALYZER_CONFORMATION_HPP

#include <vector>
#include "ligand.hpp"

//! Faces of the incoming and the outgoing ligand bound to a metal center. F means front, B means back.
enum class bridge_type { FF, FB, BF, BB };

//! Returns true if a 2-character token names a bridge type.
bool is_bridge_type(const string& token);

//! Parses a bridge type token, e.g. "FB". Throws invalid_argument on anything else.
bridge_type parse_bridge_type(const string& token);

//! Returns the rotation carrying the C2 system of a ligand to the A system of the next ligand across a metal center.
array<double, 4> bridge_rotation(const bridge_type b, const double delta);

//! Represents a ligand of a ring followed by the metal center it binds to.
class ring_unit
{
public:
	lig_type lig; //!< Ligand type.
	bridge_type bridge; //!< Bridge at the metal center after the ligand.

	explicit ring_unit(const lig_type lig, const bridge_type bridge = bridge_type::FF) : lig(lig), bridge(bridge) {}
};

//! Represents the conformation of a ring as an ordered sequence of ring units.
class conformation : public vector<ring_unit>
{
public:
	//! Parses a conformation ID such as "RRFFLLBBRRFFLLBB" or "RL(FF)RL(FF)RL(FF)".
	//! Brackets are removed, then the string is split into 2-character tokens.
	//! Throws invalid_argument if the length is odd, a token is unknown, a bridge token does not follow a ligand token, or there is no ligand at all.
	explicit conformation(const string& conf_id);

	//! Returns the conformation ID without brackets, with an explicit bridge token after every ligand token.
	string str() const;
};

//! Returns a conformation ID with all brackets removed.
string strip_brackets(const string& conf_id);

#endif
