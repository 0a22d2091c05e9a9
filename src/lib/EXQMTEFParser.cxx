/* -*- Mode: C++; c-default-style: "k&r"; indent-tabs-mode: nil; tab-width: 2; c-basic-offset: 2 -*- */
/* libexq
* Version: MPL 2.0 / LGPLv2+
*
* The contents of this file are subject to the Mozilla Public License Version
* 2.0 (the "License"); you may not use this file except in compliance with
* the License or as specified alternatively below. You may obtain a copy of
* the License at http://www.mozilla.org/MPL/
*
* Software distributed under the License is distributed on an "AS IS" basis,
* WITHOUT WARRANTY OF ANY KIND, either express or implied. See the License
* for the specific language governing rights and limitations under the
* License.
*
* For the list of contributors see the git repository.
*
* Alternatively, the contents of this file may be used under the terms of
* the GNU Lesser General Public License Version 2 or later (the "LGPLv2+"),
* in which case the provisions of the LGPLv2+ are applicable
* instead of those above.
*/

#include <string>
#include <vector>

#include "libexq_internal.hxx"

#include "EXQSymbolTable.hxx"

#include "EXQMTEFParser.hxx"

/** Internal: the structures of a EXQMTEFParser */
namespace EXQMTEFParserInternal
{
////////////////////////////////////////
//! Internal: a object of a MTEF equation: line, character, template, pile, matrix or embellishment
struct Object {
  //! the object type
  enum Type { Line, Char, Template, Pile, Matrix, Embellishment };
  //! constructor
  explicit Object(Type type)
    : m_type(type)
    , m_isNull(false)
    , m_typeface(0)
    , m_character(0)
    , m_hasMTCode(false)
    , m_embellishments()
    , m_embellishment(0)
    , m_selector(0)
    , m_variation(0)
    , m_numRows(0)
    , m_numColumns(0)
    , m_children()
  {
  }
  //! returns true if the object is a not empty line
  bool isFilledLine() const
  {
    return m_type==Line && !m_isNull && !m_children.empty();
  }
  //! the type
  Type m_type;
  //! a flag to know if a line is null
  bool m_isNull;
  //! the character typeface
  int m_typeface;
  //! the character code
  uint32_t m_character;
  //! a flag to know if the character code is a MTCode (unicode)
  bool m_hasMTCode;
  //! the character embellishments
  std::vector<int> m_embellishments;
  //! the embellishment type
  int m_embellishment;
  //! the template selector
  int m_selector;
  //! the template variation
  int m_variation;
  //! the number of matrix rows
  int m_numRows;
  //! the number of matrix columns
  int m_numColumns;
  //! the children: line's objects, template's slots, pile and matrix lines
  std::vector<std::shared_ptr<Object> > m_children;
};

//! a smart pointer of Object
typedef std::shared_ptr<Object> ObjectPtr;

////////////////////////////////////////
//! Internal: the state of a EXQMTEFParser
struct State {
  //! constructor
  State()
    : m_version(0)
    , m_input()
    , m_endPos(0)
    , m_level(0)
  {
  }
  //! the MTEF version
  int m_version;
  //! the input
  EXQInputStreamPtr m_input;
  //! the end of the MTEF data
  long m_endPos;
  //! the number of record lists being read
  int m_level;
};

//! the maximum number of nested record lists
static int const s_maxLevel=64;

////////////////////////////////////////
//! the template kinds
enum TemplateKind {
  TK_Unknown=0, TK_Fence, TK_Root, TK_Fraction, TK_Under, TK_Over, TK_Arrow,
  TK_Integral, TK_BigOperator, TK_Limit, TK_LongDivision, TK_Script, TK_Dirac
};

//! Internal: the template default characters
struct TemplateInfo {
  //! the template kind
  TemplateKind m_kind;
  //! the first character: left fence, operator, accent
  char const *m_first;
  //! the second character: right fence
  char const *m_second;
};

static TemplateInfo const s_unknownTemplate= { TK_Unknown, "", "" };

//! the MTEF 5 templates
static TemplateInfo const s_templatesV5[] = {
  { TK_Fence, "\xe2\x9f\xa8", "\xe2\x9f\xa9" }, { TK_Fence, "(", ")" }, { TK_Fence, "{", "}" },
  { TK_Fence, "[", "]" }, { TK_Fence, "|", "|" }, { TK_Fence, "\xe2\x80\x96", "\xe2\x80\x96" },
  { TK_Fence, "\xe2\x8c\x8a", "\xe2\x8c\x8b" }, { TK_Fence, "\xe2\x8c\x88", "\xe2\x8c\x89" },
  { TK_Fence, "\xe2\x9f\xa6", "\xe2\x9f\xa7" }, { TK_Fence, "[", "]" } /* interval */,
  { TK_Root, "", "" }, { TK_Fraction, "", "" },
  { TK_Under, "_", "" }, { TK_Over, "\xc2\xaf", "" }, { TK_Arrow, "\xe2\x86\x92", "" },
  { TK_Integral, "\xe2\x88\xab", "" }, { TK_BigOperator, "\xe2\x88\x91", "" },
  { TK_BigOperator, "\xe2\x88\x8f", "" }, { TK_BigOperator, "\xe2\x88\x90", "" },
  { TK_BigOperator, "\xe2\x8b\x83", "" }, { TK_BigOperator, "\xe2\x8b\x82", "" },
  { TK_Integral, "\xe2\x88\xab", "" }, { TK_BigOperator, "\xe2\x88\x91", "" },
  { TK_Limit, "", "" }, { TK_Under, "\xe2\x8f\x9f", "" }, { TK_Under, "\xe2\x8e\xb5", "" },
  { TK_LongDivision, "", "" },
  { TK_Script, "", "" }, { TK_Script, "", "" }, { TK_Script, "", "" },
  { TK_Dirac, "", "" }, { TK_Over, "\xe2\x86\x92", "" } /* vector */, { TK_Over, "\xcb\x9c", "" },
  { TK_Over, "^", "" }, { TK_Over, "\xe2\x8c\x92", "" } /* arc */
};

//! the MTEF 3 templates
static TemplateInfo const s_templatesV3[] = {
  { TK_Fence, "\xe2\x9f\xa8", "\xe2\x9f\xa9" }, { TK_Fence, "(", ")" }, { TK_Fence, "{", "}" },
  { TK_Fence, "[", "]" }, { TK_Fence, "|", "|" }, { TK_Fence, "\xe2\x80\x96", "\xe2\x80\x96" },
  { TK_Fence, "\xe2\x8c\x8a", "\xe2\x8c\x8b" }, { TK_Fence, "\xe2\x8c\x88", "\xe2\x8c\x89" },
  { TK_Fence, "[", "[" }, { TK_Fence, "]", "]" }, { TK_Fence, "]", "[" }, { TK_Fence, "[", ")" },
  { TK_Fence, "(", "]" },
  { TK_Root, "", "" }, { TK_Fraction, "", "" }, { TK_Script, "", "" },
  { TK_Under, "_", "" }, { TK_Over, "\xc2\xaf", "" },
  { TK_Arrow, "\xe2\x86\x90", "" }, { TK_Arrow, "\xe2\x86\x92", "" }, { TK_Arrow, "\xe2\x86\x94", "" },
  { TK_Integral, "\xe2\x88\xab", "" }, { TK_Integral, "\xe2\x88\xac", "" }, { TK_Integral, "\xe2\x88\xad", "" },
  { TK_Integral, "\xe2\x88\xae", "" }, { TK_Integral, "\xe2\x88\xaf", "" }, { TK_Integral, "\xe2\x88\xb0", "" },
  { TK_Under, "\xe2\x8f\x9f", "" }, { TK_Over, "\xe2\x8f\x9e", "" },
  { TK_BigOperator, "\xe2\x88\x91", "" }, { TK_BigOperator, "\xe2\x88\x91", "" },
  { TK_BigOperator, "\xe2\x88\x8f", "" }, { TK_BigOperator, "\xe2\x88\x8f", "" },
  { TK_BigOperator, "\xe2\x88\x90", "" }, { TK_BigOperator, "\xe2\x88\x90", "" },
  { TK_BigOperator, "\xe2\x8b\x83", "" }, { TK_BigOperator, "\xe2\x8b\x83", "" },
  { TK_BigOperator, "\xe2\x8b\x82", "" }, { TK_BigOperator, "\xe2\x8b\x82", "" },
  { TK_Limit, "", "" }, { TK_LongDivision, "", "" }, { TK_Fraction, "", "" } /* slash fraction */,
  { TK_Integral, "\xe2\x88\xab", "" }, { TK_BigOperator, "\xe2\x88\x91", "" },
  { TK_Script, "", "" } /* left script */, { TK_Dirac, "", "" }
};

//! returns the template information
static TemplateInfo const &getTemplateInfo(int version, int selector)
{
  if (selector<0) return s_unknownTemplate;
  if (version>=5) {
    if (size_t(selector)<EXQ_N_ELEMENTS(s_templatesV5))
      return s_templatesV5[selector];
  }
  else if (size_t(selector)<EXQ_N_ELEMENTS(s_templatesV3))
    return s_templatesV3[selector];
  return s_unknownTemplate;
}

//! returns the operator corresponding to an embellishment or 0, sets isScript if the embellishment is a prime
static char const *getEmbellishment(int type, bool &isScript)
{
  isScript=false;
  switch (type) {
  case 2:
    return "\xcb\x99";
  case 3:
    return "\xc2\xa8";
  case 4:
    return "\xe2\x83\x9b";
  case 5:
    isScript=true;
    return "\xe2\x80\xb2";
  case 6:
    isScript=true;
    return "\xe2\x80\xb3";
  case 7:
    isScript=true;
    return "\xe2\x80\xb5";
  case 8:
    return "\xcb\x9c";
  case 9:
    return "^";
  case 11:
    return "\xe2\x86\x92";
  case 12:
    return "\xe2\x86\x90";
  case 13:
    return "\xe2\x86\x94";
  case 14:
    return "\xe2\x87\x80";
  case 15:
    return "\xe2\x86\xbc";
  case 17:
    return "\xc2\xaf";
  case 18:
    isScript=true;
    return "\xe2\x80\xb4";
  case 19:
    return "\xe2\x8c\xa2";
  case 20:
    return "\xe2\x8c\xa3";
  default:
    break;
  }
  return nullptr;
}

//! Internal: the token which is being created (numbers, function names and texts are merged)
struct Token {
  //! constructor
  Token()
    : m_tag()
    , m_text()
  {
  }
  //! sends the token (if it exists) in elements
  void flush(std::vector<std::string> &elements)
  {
    if (!m_tag.empty())
      elements.push_back(libexq::mathToken(m_tag.c_str(), m_text));
    m_tag.clear();
    m_text.clear();
  }
  //! the token tag
  std::string m_tag;
  //! the token text
  std::string m_text;
};

//! returns true if the template slot id exists and is not empty
static bool hasSlot(std::vector<ObjectPtr> const &slots, size_t id)
{
  return id<slots.size() && slots[id] && slots[id]->isFilledLine();
}
}

////////////////////////////////////////////////////////////
// constructor/destructor, ...
////////////////////////////////////////////////////////////
EXQMTEFParser::EXQMTEFParser(EXQInputStreamPtr const &input, long endPos)
  : m_state(new EXQMTEFParserInternal::State)
{
  m_state->m_input=input;
  m_state->m_endPos=endPos;
}

EXQMTEFParser::~EXQMTEFParser()
{
}

bool EXQMTEFParser::parse(std::string &mathML)
{
  mathML.clear();
  if (!m_state->m_input || !readHeader())
    return false;
  std::vector<EXQMTEFParserInternal::ObjectPtr> objects, mainObjects;
  if (!readRecords(objects)) {
    EXQ_DEBUG_MSG(("EXQMTEFParser::parse: can not find the last END record\n"));
  }
  for (auto const &obj : objects) {
    if (!obj) continue;
    if (obj->m_type==EXQMTEFParserInternal::Object::Line)
      mainObjects.insert(mainObjects.end(), obj->m_children.begin(), obj->m_children.end());
    else
      mainObjects.push_back(obj);
  }
  std::vector<std::string> elements;
  sendObjects(mainObjects, elements);
  if (elements.empty()) {
    EXQ_DEBUG_MSG(("EXQMTEFParser::parse: the equation is empty\n"));
    return false;
  }
  mathML="<math display=\"block\"><mrow>";
  for (auto const &elt : elements)
    mathML+=elt;
  mathML+="</mrow></math>";
  return true;
}

////////////////////////////////////////////////////////////
// low level
////////////////////////////////////////////////////////////
int EXQMTEFParser::readByte()
{
  auto &input=m_state->m_input;
  if (input->tell()>=m_state->m_endPos) {
    EXQ_DEBUG_MSG(("EXQMTEFParser::readByte: find the end of the data\n"));
    throw libexq::ParseException();
  }
  return int(input->readULong(1));
}

int EXQMTEFParser::readUInt()
{
  int val=readByte();
  if (val==255)
    val=int(m_state->m_input->readULong(2));
  return val;
}

int EXQMTEFParser::readOptions(int tagOptions)
{
  if (m_state->m_version>=5)
    return readByte();
  return tagOptions;
}

void EXQMTEFParser::skipCString()
{
  while (readByte()!=0) {
  }
}

void EXQMTEFParser::readNudge()
{
  int dx=readByte();
  int dy=readByte();
  if (dx==128 || dy==128) {
    m_state->m_input->readULong(2);
    m_state->m_input->readULong(2);
  }
}

bool EXQMTEFParser::readHeader()
{
  int version=readByte();
  if (version==5) {
    for (int i=0; i<4; ++i) readByte(); // platform, product, version, sub version
    skipCString(); // application key
    readByte(); // equation options
  }
  else if (version==2 || version==3) {
    for (int i=0; i<4; ++i) readByte();
  }
  else {
    EXQ_DEBUG_MSG(("EXQMTEFParser::readHeader: unknown version %d\n", version));
    return false;
  }
  m_state->m_version=version;
  return true;
}

////////////////////////////////////////////////////////////
// records
////////////////////////////////////////////////////////////
bool EXQMTEFParser::readRecords(std::vector<EXQMTEFParserInternal::ObjectPtr> &objects)
{
  if (m_state->m_level>=EXQMTEFParserInternal::s_maxLevel) {
    EXQ_DEBUG_MSG(("EXQMTEFParser::readRecords: the records are nested too deeply\n"));
    throw libexq::ParseException();
  }
  ++m_state->m_level;
  auto &input=m_state->m_input;
  bool const v5=m_state->m_version>=5;
  while (input->tell()<m_state->m_endPos) {
    long pos=input->tell();
    int tag=readByte();
    int type=v5 ? tag : (tag&0xf);
    int tagOptions=v5 ? 0 : (tag>>4);
    EXQMTEFParserInternal::ObjectPtr object;
    switch (type) {
    case 0: // END
      --m_state->m_level;
      return true;
    case 1:
      object=readLine(readOptions(tagOptions));
      break;
    case 2:
      object=readChar(readOptions(tagOptions));
      break;
    case 3:
      object=readTemplate(readOptions(tagOptions));
      break;
    case 4:
      object=readPile(readOptions(tagOptions));
      break;
    case 5:
      object=readMatrix(readOptions(tagOptions));
      break;
    case 6:
      object=readEmbellishment(readOptions(tagOptions));
      break;
    case 7:
      readRulerData();
      break;
    case 8:
      if (v5) { // FONT_STYLE_DEF
        readUInt();
        readByte();
      }
      else { // FONT: typeface, style, name
        readByte();
        readByte();
        skipCString();
      }
      break;
    case 9:
      readSize();
      break;
    case 10: // FULL, SUB, SUB2, SYM, SUBSYM
    case 11:
    case 12:
    case 13:
    case 14:
      break;
    case 15: // COLOR
      if (!v5) throw libexq::ParseException();
      readUInt();
      break;
    case 16: { // COLOR_DEF
      if (!v5) throw libexq::ParseException();
      int options=readByte();
      int numValues=(options&1) ? 4 : 3;
      for (int i=0; i<numValues; ++i)
        input->readULong(2);
      if (options&4)
        skipCString();
      break;
    }
    case 17: // FONT_DEF
      if (!v5) throw libexq::ParseException();
      readUInt();
      skipCString();
      break;
    case 18:
      if (!v5) throw libexq::ParseException();
      readPreferences();
      break;
    case 19: // ENCODING_DEF
      if (!v5) throw libexq::ParseException();
      skipCString();
      break;
    default:
      if (v5 && type>=100) {
        auto len=long(input->readULong(2));
        if (!input->checkPosition(input->tell()+len) || input->tell()+len>m_state->m_endPos) {
          EXQ_DEBUG_MSG(("EXQMTEFParser::readRecords: the future record %d at pos %ld seems too long\n", type, pos));
          throw libexq::ParseException();
        }
        input->seek(len, librevenge::RVNG_SEEK_CUR);
        break;
      }
      EXQ_DEBUG_MSG(("EXQMTEFParser::readRecords: find unknown record %d at pos %ld\n", type, pos));
      throw libexq::ParseException();
    }
    if (object)
      objects.push_back(object);
  }
  --m_state->m_level;
  return false;
}

void EXQMTEFParser::readChildren(EXQMTEFParserInternal::Object &object)
{
  if (!readRecords(object.m_children)) {
    EXQ_DEBUG_MSG(("EXQMTEFParser::readChildren: can not find the END record\n"));
    throw libexq::ParseException();
  }
}

EXQMTEFParserInternal::ObjectPtr EXQMTEFParser::readLine(int options)
{
  auto line=std::make_shared<EXQMTEFParserInternal::Object>(EXQMTEFParserInternal::Object::Line);
  if (options&0x8)
    readNudge();
  if (options&0x4) // line spacing
    m_state->m_input->readULong(2);
  if (options&0x2)
    readRuler();
  if (options&0x1)
    line->m_isNull=true;
  else
    readChildren(*line);
  return line;
}

EXQMTEFParserInternal::ObjectPtr EXQMTEFParser::readChar(int options)
{
  auto &input=m_state->m_input;
  auto character=std::make_shared<EXQMTEFParserInternal::Object>(EXQMTEFParserInternal::Object::Char);
  if (options&0x8)
    readNudge();
  character->m_typeface=readByte()-128;
  bool hasEmbellishments;
  if (m_state->m_version>=5) {
    if ((options&0x4)==0) {
      character->m_character=uint32_t(input->readULong(2));
      character->m_hasMTCode=true;
    }
    if (options&0x2) {
      auto fontPos=uint32_t(readByte());
      if (!character->m_hasMTCode) character->m_character=fontPos;
    }
    if (options&0x10) {
      auto fontPos=uint32_t(input->readULong(2));
      if (!character->m_hasMTCode) character->m_character=fontPos;
    }
    hasEmbellishments=(options&0x1)!=0;
  }
  else {
    character->m_character=uint32_t(input->readULong(2));
    character->m_hasMTCode=true;
    hasEmbellishments=(options&0x2)!=0;
  }
  if (hasEmbellishments) {
    std::vector<EXQMTEFParserInternal::ObjectPtr> embellishments;
    if (!readRecords(embellishments))
      throw libexq::ParseException();
    for (auto const &emb : embellishments) {
      if (emb && emb->m_type==EXQMTEFParserInternal::Object::Embellishment)
        character->m_embellishments.push_back(emb->m_embellishment);
    }
  }
  return character;
}

EXQMTEFParserInternal::ObjectPtr EXQMTEFParser::readTemplate(int options)
{
  auto tmpl=std::make_shared<EXQMTEFParserInternal::Object>(EXQMTEFParserInternal::Object::Template);
  if (options&0x8)
    readNudge();
  tmpl->m_selector=readByte();
  int variation=readByte();
  if (m_state->m_version>=5 && (variation&0x80))
    variation=(variation&0x7f)|(readByte()<<8);
  tmpl->m_variation=variation;
  readByte(); // template specific options
  readChildren(*tmpl);
  return tmpl;
}

EXQMTEFParserInternal::ObjectPtr EXQMTEFParser::readPile(int options)
{
  auto pile=std::make_shared<EXQMTEFParserInternal::Object>(EXQMTEFParserInternal::Object::Pile);
  if (options&0x8)
    readNudge();
  readByte(); // halign
  readByte(); // valign
  if (options&0x2)
    readRuler();
  readChildren(*pile);
  return pile;
}

EXQMTEFParserInternal::ObjectPtr EXQMTEFParser::readMatrix(int options)
{
  auto matrix=std::make_shared<EXQMTEFParserInternal::Object>(EXQMTEFParserInternal::Object::Matrix);
  if (options&0x8)
    readNudge();
  readByte(); // valign
  readByte(); // h_just
  readByte(); // v_just
  matrix->m_numRows=readByte();
  matrix->m_numColumns=readByte();
  // the row and column partition lines: 2 bits by line
  int numBytes=((matrix->m_numRows+1)*2+7)/8+((matrix->m_numColumns+1)*2+7)/8;
  for (int i=0; i<numBytes; ++i)
    readByte();
  readChildren(*matrix);
  return matrix;
}

EXQMTEFParserInternal::ObjectPtr EXQMTEFParser::readEmbellishment(int options)
{
  auto emb=std::make_shared<EXQMTEFParserInternal::Object>(EXQMTEFParserInternal::Object::Embellishment);
  if (options&0x8)
    readNudge();
  emb->m_embellishment=readByte();
  return emb;
}

void EXQMTEFParser::readRuler()
{
  int tag=readByte();
  int type=m_state->m_version>=5 ? tag : (tag&0xf);
  if (type!=7) {
    EXQ_DEBUG_MSG(("EXQMTEFParser::readRuler: unexpected record %d\n", type));
    throw libexq::ParseException();
  }
  readRulerData();
}

void EXQMTEFParser::readRulerData()
{
  int numStops=readByte();
  for (int i=0; i<numStops; ++i) {
    readByte(); // type
    m_state->m_input->readULong(2); // offset
  }
}

void EXQMTEFParser::readSize()
{
  int lSize=readByte();
  if (lSize==101)
    m_state->m_input->readULong(2);
  else if (lSize==100) {
    readByte();
    m_state->m_input->readULong(2);
  }
  else
    readByte();
}

void EXQMTEFParser::readPreferences()
{
  readByte(); // options
  readDimensions(readByte()); // sizes
  readDimensions(readByte()); // spaces
  int numStyles=readByte();
  for (int i=0; i<numStyles; ++i) {
    if (readByte())
      readByte();
  }
}

void EXQMTEFParser::readDimensions(int num)
{
  // each dimension is a list of nibbles ended by 0xf
  int found=0;
  while (found<num) {
    int val=readByte();
    if ((val>>4)==0xf) ++found;
    if (found>=num) break;
    if ((val&0xf)==0xf) ++found;
  }
}

////////////////////////////////////////////////////////////
// MathML
////////////////////////////////////////////////////////////
bool EXQMTEFParser::getCharacter(EXQMTEFParserInternal::Object const &character, std::string &tag, std::string &text, bool &canMerge) const
{
  tag.clear();
  text.clear();
  canMerge=false;
  int const typeface=character.m_typeface;
  uint32_t c=character.m_character;
  if (c==0 || typeface==24 || (c>=0xef00 && c<=0xef0f)) // spaces
    return false;
  if (!character.m_hasMTCode && typeface==6 && c>=0x20 && c<0x100)
    c|=0xf000;
  if (c<0xf020 || c>0xf0ff || !EXQSymbolTable::lookup("symbol", c, text))
    libexq::appendUnicode(c, text);

  switch (typeface) {
  case 1: // text
    tag="mtext";
    canMerge=true;
    break;
  case 2: // function
    tag="mi";
    canMerge=true;
    break;
  case 8: // number
    tag="mn";
    canMerge=true;
    break;
  case 6: // symbol
  case 11: // extra symbol
    tag="mo";
    break;
  default:
    if (c<0x80 && libexq::isDigit(char(c))) {
      tag="mn";
      canMerge=true;
    }
    else if ((c<0x80 && !libexq::isLetter(char(c))) || (c>=0x2190 && c<0x2300))
      tag="mo";
    else
      tag="mi";
    break;
  }
  return true;
}

std::string EXQMTEFParser::embellish(EXQMTEFParserInternal::Object const &character, std::string const &element) const
{
  std::string res(element);
  for (auto type : character.m_embellishments) {
    bool isScript;
    char const *op=EXQMTEFParserInternal::getEmbellishment(type, isScript);
    if (!op) {
      EXQ_DEBUG_MSG(("EXQMTEFParser::embellish: ignore embellishment %d\n", type));
      continue;
    }
    res=libexq::mathElement(isScript ? "msup" : "mover", res+libexq::mathToken("mo", op));
  }
  return res;
}

void EXQMTEFParser::sendObjects(std::vector<EXQMTEFParserInternal::ObjectPtr> const &objects,
                                std::vector<std::string> &elements) const
{
  EXQMTEFParserInternal::Token token;
  for (auto const &obj : objects) {
    if (!obj) continue;
    switch (obj->m_type) {
    case EXQMTEFParserInternal::Object::Char: {
      std::string tag, text;
      bool canMerge;
      if (!getCharacter(*obj, tag, text, canMerge))
        break;
      if (!obj->m_embellishments.empty()) {
        token.flush(elements);
        elements.push_back(embellish(*obj, libexq::mathToken(tag.c_str(), text)));
      }
      else if (canMerge && tag==token.m_tag)
        token.m_text+=text;
      else {
        token.flush(elements);
        if (canMerge) {
          token.m_tag=tag;
          token.m_text=text;
        }
        else
          elements.push_back(libexq::mathToken(tag.c_str(), text));
      }
      break;
    }
    case EXQMTEFParserInternal::Object::Line:
      token.flush(elements);
      if (!obj->m_isNull)
        elements.push_back(sendLine(obj));
      break;
    case EXQMTEFParserInternal::Object::Template: {
      token.flush(elements);
      auto const &info=EXQMTEFParserInternal::getTemplateInfo(m_state->m_version, obj->m_selector);
      if (info.m_kind==EXQMTEFParserInternal::TK_Script) {
        std::string base("<mrow></mrow>");
        if (!elements.empty()) {
          base=elements.back();
          elements.pop_back();
        }
        elements.push_back(sendScript(*obj, base));
      }
      else
        elements.push_back(sendTemplate(*obj));
      break;
    }
    case EXQMTEFParserInternal::Object::Pile:
      token.flush(elements);
      elements.push_back(sendPile(*obj));
      break;
    case EXQMTEFParserInternal::Object::Matrix:
      token.flush(elements);
      elements.push_back(sendMatrix(*obj));
      break;
    case EXQMTEFParserInternal::Object::Embellishment:
    default:
      break;
    }
  }
  token.flush(elements);
}

std::string EXQMTEFParser::sendLine(EXQMTEFParserInternal::ObjectPtr const &line) const
{
  if (!line || !line->isFilledLine())
    return "<mrow></mrow>";
  std::vector<std::string> elements;
  sendObjects(line->m_children, elements);
  if (elements.empty())
    return "<mrow></mrow>";
  return libexq::mathRow(elements);
}

std::string EXQMTEFParser::sendScript(EXQMTEFParserInternal::Object const &tmpl, std::string const &base) const
{
  std::vector<EXQMTEFParserInternal::ObjectPtr> slots;
  for (auto const &child : tmpl.m_children) {
    if (child && child->m_type==EXQMTEFParserInternal::Object::Line)
      slots.push_back(child);
  }
  bool hasSub=EXQMTEFParserInternal::hasSlot(slots, 0);
  bool hasSup=EXQMTEFParserInternal::hasSlot(slots, 1);
  if (hasSub && hasSup)
    return libexq::mathElement("msubsup", base+sendLine(slots[0])+sendLine(slots[1]));
  if (hasSub)
    return libexq::mathElement("msub", base+sendLine(slots[0]));
  if (hasSup)
    return libexq::mathElement("msup", base+sendLine(slots[1]));
  return base;
}

std::string EXQMTEFParser::sendTemplate(EXQMTEFParserInternal::Object const &tmpl) const
{
  auto const &info=EXQMTEFParserInternal::getTemplateInfo(m_state->m_version, tmpl.m_selector);
  std::vector<EXQMTEFParserInternal::ObjectPtr> slots;
  std::vector<std::string> characters;
  for (auto const &child : tmpl.m_children) {
    if (!child) continue;
    if (child->m_type==EXQMTEFParserInternal::Object::Line)
      slots.push_back(child);
    else if (child->m_type==EXQMTEFParserInternal::Object::Char) {
      std::string tag, text;
      bool canMerge;
      if (getCharacter(*child, tag, text, canMerge))
        characters.push_back(text);
    }
  }
  std::string slot0=slots.empty() ? "<mrow></mrow>" : sendLine(slots[0]);
  bool const hasSlot1=EXQMTEFParserInternal::hasSlot(slots, 1);
  bool const hasSlot2=EXQMTEFParserInternal::hasSlot(slots, 2);
  std::string const op=characters.empty() ? std::string(info.m_first) : characters[0];
  switch (info.m_kind) {
  case EXQMTEFParserInternal::TK_Fence: {
    bool hasLeft=true, hasRight=true;
    if (m_state->m_version>=5 && (tmpl.m_variation&3)) {
      hasLeft=(tmpl.m_variation&1)!=0;
      hasRight=(tmpl.m_variation&2)!=0;
    }
    size_t c=0;
    std::string left(info.m_first), right(info.m_second);
    if (hasLeft && c<characters.size()) left=characters[c++];
    if (hasRight && c<characters.size()) right=characters[c++];
    std::string content;
    if (hasLeft) content+=libexq::mathToken("mo", left);
    content+=slot0;
    if (hasRight) content+=libexq::mathToken("mo", right);
    return libexq::mathElement("mrow", content);
  }
  case EXQMTEFParserInternal::TK_Root:
    if (hasSlot1 && tmpl.m_variation!=0)
      return libexq::mathElement("mroot", slot0+sendLine(slots[1]));
    return libexq::mathElement("msqrt", slot0);
  case EXQMTEFParserInternal::TK_Fraction:
    return libexq::mathElement("mfrac", slot0+(slots.size()>1 ? sendLine(slots[1]) : std::string("<mrow></mrow>")));
  case EXQMTEFParserInternal::TK_Under: {
    std::string res=libexq::mathElement("munder", slot0+libexq::mathToken("mo", info.m_first));
    if (hasSlot1)
      res=libexq::mathElement("munder", res+sendLine(slots[1]));
    return res;
  }
  case EXQMTEFParserInternal::TK_Over: {
    std::string res=libexq::mathElement("mover", slot0+libexq::mathToken("mo", info.m_first));
    if (hasSlot1)
      res=libexq::mathElement("mover", res+sendLine(slots[1]));
    return res;
  }
  case EXQMTEFParserInternal::TK_Arrow: {
    bool const hasTop=EXQMTEFParserInternal::hasSlot(slots, 0);
    std::string const arrow=libexq::mathToken("mo", op);
    if (hasTop && hasSlot1)
      return libexq::mathElement("munderover", arrow+sendLine(slots[1])+slot0);
    if (hasTop)
      return libexq::mathElement("mover", arrow+slot0);
    if (hasSlot1)
      return libexq::mathElement("munder", arrow+sendLine(slots[1]));
    return arrow;
  }
  case EXQMTEFParserInternal::TK_Integral:
  case EXQMTEFParserInternal::TK_BigOperator: {
    bool const isIntegral=info.m_kind==EXQMTEFParserInternal::TK_Integral;
    std::string res=libexq::mathToken("mo", op);
    if (hasSlot1 && hasSlot2)
      res=libexq::mathElement(isIntegral ? "msubsup" : "munderover", res+sendLine(slots[1])+sendLine(slots[2]));
    else if (hasSlot1)
      res=libexq::mathElement(isIntegral ? "msub" : "munder", res+sendLine(slots[1]));
    else if (hasSlot2)
      res=libexq::mathElement(isIntegral ? "msup" : "mover", res+sendLine(slots[2]));
    return libexq::mathElement("mrow", res+slot0);
  }
  case EXQMTEFParserInternal::TK_Limit:
    if (hasSlot1 && hasSlot2)
      return libexq::mathElement("munderover", slot0+sendLine(slots[1])+sendLine(slots[2]));
    if (hasSlot1)
      return libexq::mathElement("munder", slot0+sendLine(slots[1]));
    if (hasSlot2)
      return libexq::mathElement("mover", slot0+sendLine(slots[2]));
    return slot0;
  case EXQMTEFParserInternal::TK_LongDivision: {
    std::string res("<menclose notation=\"longdiv\">"+slot0+"</menclose>");
    if (hasSlot1)
      res=libexq::mathElement("mover", res+sendLine(slots[1]));
    return res;
  }
  case EXQMTEFParserInternal::TK_Dirac:
    return libexq::mathElement("mrow", libexq::mathToken("mo", "\xe2\x9f\xa8")+slot0+libexq::mathToken("mo", "|")+
                               (slots.size()>1 ? sendLine(slots[1]) : std::string())+libexq::mathToken("mo", "\xe2\x9f\xa9"));
  case EXQMTEFParserInternal::TK_Script:
  case EXQMTEFParserInternal::TK_Unknown:
  default:
    break;
  }
  EXQ_DEBUG_MSG(("EXQMTEFParser::sendTemplate: unknown template %d\n", tmpl.m_selector));
  std::vector<std::string> elements;
  for (auto const &slot : slots) {
    if (slot && slot->isFilledLine())
      elements.push_back(sendLine(slot));
  }
  if (elements.empty())
    return "<mrow></mrow>";
  return libexq::mathRow(elements);
}

std::string EXQMTEFParser::sendPile(EXQMTEFParserInternal::Object const &pile) const
{
  std::string res("<mtable>");
  for (auto const &child : pile.m_children) {
    if (!child || child->m_type!=EXQMTEFParserInternal::Object::Line) continue;
    res+="<mtr><mtd>"+sendLine(child)+"</mtd></mtr>";
  }
  res+="</mtable>";
  return res;
}

std::string EXQMTEFParser::sendMatrix(EXQMTEFParserInternal::Object const &matrix) const
{
  std::vector<EXQMTEFParserInternal::ObjectPtr> cells;
  for (auto const &child : matrix.m_children) {
    if (child && child->m_type==EXQMTEFParserInternal::Object::Line)
      cells.push_back(child);
  }
  if (matrix.m_numRows<=0 || matrix.m_numColumns<=0)
    return sendPile(matrix);
  std::string res("<mtable>");
  for (int r=0; r<matrix.m_numRows; ++r) {
    res+="<mtr>";
    for (int c=0; c<matrix.m_numColumns; ++c) {
      auto id=size_t(r*matrix.m_numColumns+c);
      res+="<mtd>";
      if (id<cells.size())
        res+=sendLine(cells[id]);
      res+="</mtd>";
    }
    res+="</mtr>";
  }
  res+="</mtable>";
  return res;
}

////////////////////////////////////////////////////////////
// the converter
////////////////////////////////////////////////////////////
EXQMTEFConverter::EXQMTEFConverter()
  : EXQEquationConverter()
{
}

EXQMTEFConverter::~EXQMTEFConverter()
{
}

bool EXQMTEFConverter::readEquationHeader(EXQInputStream &input, long &beginPos, long &endPos)
{
  if (!input.checkPosition(28))
    return false;
  input.seek(0, librevenge::RVNG_SEEK_SET);
  auto headerSize=long(input.readULong(2));
  if (headerSize!=28)
    return false;
  input.readULong(4); // version
  input.readULong(2); // clipboard format
  auto dataSize=long(input.readULong(4));
  beginPos=headerSize;
  endPos=input.size();
  if (dataSize>0 && headerSize+dataSize<endPos)
    endPos=headerSize+dataSize;
  return true;
}

bool EXQMTEFConverter::convert(librevenge::RVNGBinaryData const &data, std::string &mathML)
try
{
  mathML.clear();
  EXQInputStreamPtr input=EXQInputStream::get(data);
  if (!input)
    return false;
  if (input->isStructured()) {
    auto eqnInput=input->getSubStreamByName("Equation Native");
    if (!eqnInput) {
      EXQ_DEBUG_MSG(("EXQMTEFConverter::convert: can not find the equation stream\n"));
      return false;
    }
    input=eqnInput;
  }
  long beginPos=0, endPos=input->size();
  if (!readEquationHeader(*input, beginPos, endPos)) {
    EXQ_DEBUG_MSG(("EXQMTEFConverter::convert: no equation header, try to read raw MTEF\n"));
  }
  input->seek(beginPos, librevenge::RVNG_SEEK_SET);
  EXQMTEFParser parser(input, endPos);
  return parser.parse(mathML);
}
catch (libexq::FileException const &)
{
  EXQ_DEBUG_MSG(("EXQMTEFConverter::convert: File exception trapped\n"));
  mathML.clear();
  return false;
}
catch (libexq::ParseException const &)
{
  EXQ_DEBUG_MSG(("EXQMTEFConverter::convert: Parse exception trapped\n"));
  mathML.clear();
  return false;
}
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
