// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_INSTRUMENT_H
#define __REBALANCER_INSTRUMENT_H 1

#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace rebalancer
{
  class InstrumentException : public std::runtime_error
  {
  public:
  InstrumentException(const std::string msg) 
    : std::runtime_error(msg)
      {}

    ~InstrumentException()
      {}

  };

  /**
   * @class InstrumentDescriptor
   * @brief Static description of a tradable equity.
   *
   * The code is the unique key used by the data source, the selector and
   * the ledger. Optional attributes (industry, market, ...) are carried
   * through for reporting and for user defined strategies. A descriptor is
   * immutable once constructed.
   */
  class InstrumentDescriptor
  {
  public:
    typedef std::map<std::string, std::string> AttributeMap;

    InstrumentDescriptor (const std::string& code,
			  const std::string& name,
			  const AttributeMap& attributes = AttributeMap())
      : mCode(code),
	mName(name),
	mAttributes(attributes)
    {
      if (mCode.empty())
	throw InstrumentException ("InstrumentDescriptor: instrument code cannot be empty");
    }

    InstrumentDescriptor (const InstrumentDescriptor& rhs) = default;
    InstrumentDescriptor& operator=(const InstrumentDescriptor& rhs) = default;

    ~InstrumentDescriptor()
    {}

    const std::string& getCode() const
    {
      return mCode;
    }

    const std::string& getName() const
    {
      return mName;
    }

    const AttributeMap& getAttributes() const
    {
      return mAttributes;
    }

    std::optional<std::string> getAttribute (const std::string& key) const
    {
      auto it = mAttributes.find (key);
      if (it == mAttributes.end())
	return std::nullopt;

      return it->second;
    }

  private:
    std::string mCode;
    std::string mName;
    AttributeMap mAttributes;
  };

  inline bool operator==(const InstrumentDescriptor& lhs, const InstrumentDescriptor& rhs)
  {
    return (lhs.getCode() == rhs.getCode()) &&
      (lhs.getName() == rhs.getName()) &&
      (lhs.getAttributes() == rhs.getAttributes());
  }

  inline bool operator!=(const InstrumentDescriptor& lhs, const InstrumentDescriptor& rhs)
  {
    return !(lhs == rhs);
  }
}

#endif
