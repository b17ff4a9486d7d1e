/*
 * Kind.cpp
 *
 *  Created on: October 2026
 *
 *  Text rendering of every kind. Containers render their elements
 *  recursively, borrowing each element for reading.
 */

#include "../headers/pycore_internal.h"

namespace pycore
{
    namespace
    {
        void renderElement(const PyObjectRef& element, std::string& out, std::vector<const PyObject*>& visiting)
        {
            PyReadGuard guard = element.borrow();
            guard->renderTo(out, visiting);
        }

        void renderSequence(
            const PyObjectList& elements,
            const char* open,
            const char* close,
            std::string& out,
            std::vector<const PyObject*>& visiting)
        {
            out += open;
            for (unsigned long i = 0; i < elements.size(); ++i) {
                if (i > 0) out += ", ";
                renderElement(elements[i], out, visiting);
            }
            out += close;
        }

        void renderBound(const SliceBound& bound, std::string& out)
        {
            if (bound.present) out += Integer::toString(bound.value);
            else out += "None";
        }
    }

    void StringKind::render(std::string& out, std::vector<const PyObject*>& visiting) const
    {
        out += this->value;
    }

    void IntegerKind::render(std::string& out, std::vector<const PyObject*>& visiting) const
    {
        out += Integer::toString(this->value);
    }

    void BooleanKind::render(std::string& out, std::vector<const PyObject*>& visiting) const
    {
        out += this->value ? "true" : "false";
    }

    void ListKind::render(std::string& out, std::vector<const PyObject*>& visiting) const
    {
        renderSequence(this->elements, "[", "]", out, visiting);
    }

    void TupleKind::render(std::string& out, std::vector<const PyObject*>& visiting) const
    {
        renderSequence(this->elements, "{", "}", out, visiting);
    }

    void DictKind::render(std::string& out, std::vector<const PyObject*>& visiting) const
    {
        out += "{";
        bool first = true;
        for (const auto& entry : this->elements) {
            if (!first) out += ", ";
            first = false;
            out += "'";
            out += entry.first;
            out += "': ";
            renderElement(entry.second, out, visiting);
        }
        out += "}";
    }

    void IteratorKind::render(std::string& out, std::vector<const PyObject*>& visiting) const
    {
        out += "<iter pos ";
        out += std::to_string(this->position);
        out += " in ";
        renderElement(this->target, out, visiting);
        out += ">";
    }

    void SliceKind::render(std::string& out, std::vector<const PyObject*>& visiting) const
    {
        out += "<slice '";
        renderBound(this->start, out);
        out += ":";
        renderBound(this->stop, out);
        out += ":";
        renderBound(this->step, out);
        out += "'>";
    }

    void NameErrorKind::render(std::string& out, std::vector<const PyObject*>& visiting) const
    {
        out += "<NameError '" + this->name + "'>";
    }

    void CodeKind::render(std::string& out, std::vector<const PyObject*>& visiting) const
    {
        out += "<code>";
    }

    void FunctionKind::render(std::string& out, std::vector<const PyObject*>& visiting) const
    {
        out += "<func>";
    }

    void ModuleKind::render(std::string& out, std::vector<const PyObject*>& visiting) const
    {
        out += "<module '" + this->name + "'>";
    }

    void NoneKind::render(std::string& out, std::vector<const PyObject*>& visiting) const
    {
        out += "None";
    }

    void ClassKind::render(std::string& out, std::vector<const PyObject*>& visiting) const
    {
        out += "<class '" + this->name + "'>";
    }

    void NativeFunctionKind::render(std::string& out, std::vector<const PyObject*>& visiting) const
    {
        out += "<native function>";
    }
}
